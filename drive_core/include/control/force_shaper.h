#pragma once
#include "control/drive_tuning.h"
#include "input/vehicle_input.h"
#include "vehicle/vehicle_state.h"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>

struct IRigidBody;

namespace Drive {

    enum class ControlRegime : uint8_t {
        Grounded = 0,
        Airborne
    };

    // Execution order of apply(); the order is part of the contract
    enum class ShaperStage : uint8_t {
        Drive = 0,
        Steering,
        LateralGrip,
        Downforce,
        Upright,
        InversionRecovery,
        AirborneAngularCap,
        SpeedClamp,
        Count
    };

    const char* toString(ShaperStage stage);
    const char* toString(ControlRegime regime);

    // Everything one apply() issued, for telemetry and tests
    struct ShapingReport {
        ControlRegime regime = ControlRegime::Airborne;

        glm::vec3 driveForce{ 0.f };
        glm::vec3 steeringTorque{ 0.f };
        float     targetYawRate = 0.f;
        glm::vec3 downforce{ 0.f };
        glm::vec3 uprightTorque{ 0.f };
        glm::vec3 recoveryTorque{ 0.f };

        bool  lateralGripApplied = false;
        float lateralSpeedBefore = 0.f;
        float lateralSpeedAfter = 0.f;
        bool  angularDampingApplied = false;
        bool  angularCapApplied = false;
        bool  speedClampApplied = false;

        // Bit per ShaperStage that threw and was skipped
        uint32_t failedStages = 0;

        bool stageFailed(ShaperStage stage) const {
            return (failedStages & (1u << static_cast<uint32_t>(stage))) != 0;
        }
    };

    // Layers corrective forces on top of the physics engine, once per fixed step.
    // Every force and torque goes through ForceMode::Acceleration so behavior does
    // not depend on mass. Stages 1-2 scale by regime, stages 3-7 are gated by it and
    // the horizontal speed clamp always runs last.
    //
    // Positive steering yaws the body forward axis (+Z) toward +X.
    class ForceShaper {
    public:
        explicit ForceShaper(const DriveTuning& tuning);
        // Holds the tuning by reference; it must outlive the shaper
        explicit ForceShaper(DriveTuning&&) = delete;

        // Runs all stages in order. A stage that throws is logged once and skipped;
        // the remaining stages still run.
        ShapingReport apply(IRigidBody& body, const VehicleState& state,
            const DriveCommand& command, float dt);

        // Individual stages. Each reads the body's current velocities.
        glm::vec3 applyDrive(IRigidBody& body, const VehicleState& state, float throttle) const;
        glm::vec3 applySteering(IRigidBody& body, const VehicleState& state,
            const DriveCommand& command, float* outTargetYawRate = nullptr) const;
        bool      applyLateralGrip(IRigidBody& body, const VehicleState& state, float dt,
            float* outBefore = nullptr, float* outAfter = nullptr) const;
        glm::vec3 applyDownforce(IRigidBody& body, const VehicleState& state) const;
        glm::vec3 applyUpright(IRigidBody& body, const VehicleState& state, float dt,
            bool* outDamped = nullptr) const;
        glm::vec3 applyInversionRecovery(IRigidBody& body, const VehicleState& state) const;
        bool      applyAirborneAngularCap(IRigidBody& body, const VehicleState& state) const;
        bool      applySpeedClamp(IRigidBody& body) const;

        // Target yaw rate for the given state and input, clamped to maxYawSpeed
        float computeTargetYawRate(const VehicleState& state, const DriveCommand& command) const;
        static bool isInverted(const glm::vec3& bodyUp, float threshold);

        const DriveTuning& getTuning() const { return m_tuning; }

    private:
        template<typename Fn>
        void runStage(ShaperStage stage, ShapingReport& report, Fn&& fn);

        const DriveTuning& m_tuning;
        std::array<bool, static_cast<size_t>(ShaperStage::Count)> m_reportedFailure{};
    };

}
