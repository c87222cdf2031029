#include "common/drive_pch.h"
#include "control/force_shaper.h"
#include "interfaces/rigid_body_i.h"
#include "common/drive_math.h"

namespace Drive {

    const char* toString(ShaperStage stage)
    {
        switch (stage) {
        case ShaperStage::Drive:              return "drive";
        case ShaperStage::Steering:           return "steering";
        case ShaperStage::LateralGrip:        return "lateral_grip";
        case ShaperStage::Downforce:          return "downforce";
        case ShaperStage::Upright:            return "upright";
        case ShaperStage::InversionRecovery:  return "inversion_recovery";
        case ShaperStage::AirborneAngularCap: return "airborne_angular_cap";
        case ShaperStage::SpeedClamp:         return "speed_clamp";
        default:                              return "unknown";
        }
    }

    const char* toString(ControlRegime regime)
    {
        return regime == ControlRegime::Grounded ? "grounded" : "airborne";
    }

    ForceShaper::ForceShaper(const DriveTuning& tuning)
        : m_tuning(tuning)
    {
    }

    template<typename Fn>
    void ForceShaper::runStage(ShaperStage stage, ShapingReport& report, Fn&& fn)
    {
        const auto index = static_cast<size_t>(stage);
        try {
            fn();
            m_reportedFailure[index] = false;
        }
        catch (const std::exception& e) {
            report.failedStages |= 1u << static_cast<uint32_t>(stage);
            if (!m_reportedFailure[index]) {
                spdlog::error("[ForceShaper] Stage '{}' failed and was skipped: {}", toString(stage), e.what());
                m_reportedFailure[index] = true;
            }
        }
    }

    ShapingReport ForceShaper::apply(IRigidBody& body, const VehicleState& state,
        const DriveCommand& command, float dt)
    {
        ShapingReport report;
        report.regime = state.isGrounded ? ControlRegime::Grounded : ControlRegime::Airborne;

        const float stepDt = (std::isfinite(dt) && dt > 0.f) ? dt : 0.f;
        const DriveCommand input = normalizeInput(KeyboardInput{ command.throttle, command.steering });

        runStage(ShaperStage::Drive, report, [&] {
            report.driveForce = applyDrive(body, state, input.throttle);
        });
        runStage(ShaperStage::Steering, report, [&] {
            report.steeringTorque = applySteering(body, state, input, &report.targetYawRate);
        });
        runStage(ShaperStage::LateralGrip, report, [&] {
            report.lateralGripApplied = applyLateralGrip(body, state, stepDt,
                &report.lateralSpeedBefore, &report.lateralSpeedAfter);
        });
        runStage(ShaperStage::Downforce, report, [&] {
            report.downforce = applyDownforce(body, state);
        });
        runStage(ShaperStage::Upright, report, [&] {
            report.uprightTorque = applyUpright(body, state, stepDt, &report.angularDampingApplied);
        });
        runStage(ShaperStage::InversionRecovery, report, [&] {
            report.recoveryTorque = applyInversionRecovery(body, state);
        });
        runStage(ShaperStage::AirborneAngularCap, report, [&] {
            report.angularCapApplied = applyAirborneAngularCap(body, state);
        });
        runStage(ShaperStage::SpeedClamp, report, [&] {
            report.speedClampApplied = applySpeedClamp(body);
        });

        return report;
    }

    glm::vec3 ForceShaper::applyDrive(IRigidBody& body, const VehicleState& state, float throttle) const
    {
        if (throttle == 0.f) return glm::vec3(0.f);

        const float driveAuthority = state.isGrounded ? 1.f : m_tuning.airborneDriveFactor;
        const glm::vec3 forward = finiteOr(body.getOrientation()) * LOCAL_FORWARD;

        const glm::vec3 force = forward * (throttle * m_tuning.forwardSpeedFactor * driveAuthority);
        body.addForce(force, ForceMode::Acceleration);
        return force;
    }

    float ForceShaper::computeTargetYawRate(const VehicleState& state, const DriveCommand& command) const
    {
        // No drive intent, no steering authority: a parked vehicle does not spin in place
        const float target = command.steering * m_tuning.turnSpeedFactor
            * state.controlAuthority * std::abs(command.throttle);
        return glm::clamp(target, -m_tuning.maxYawSpeed, m_tuning.maxYawSpeed);
    }

    glm::vec3 ForceShaper::applySteering(IRigidBody& body, const VehicleState& state,
        const DriveCommand& command, float* outTargetYawRate) const
    {
        const float targetYaw = computeTargetYawRate(state, command);
        if (outTargetYawRate) *outTargetYawRate = targetYaw;

        // Without drive intent the stage issues nothing; stabilization owns the yaw then
        if (command.throttle == 0.f)
            return glm::vec3(0.f);

        const glm::vec3 up = finiteOr(body.getOrientation()) * WORLD_UP;
        const glm::vec3 angularVelocity = finiteOr(body.getAngularVelocity(), glm::vec3(0.f));
        const float yawDelta = targetYaw - glm::dot(angularVelocity, up);

        const float response = m_tuning.steeringResponse
            * (state.isGrounded ? 1.f : m_tuning.airborneSteeringResponse);
        const glm::vec3 torque = up * (yawDelta * response);

        body.addTorque(torque, ForceMode::Acceleration);
        return torque;
    }

    bool ForceShaper::applyLateralGrip(IRigidBody& body, const VehicleState& state, float dt,
        float* outBefore, float* outAfter) const
    {
        if (!state.isGrounded) return false;

        const glm::quat orientation = finiteOr(body.getOrientation());
        const glm::vec3 velocity = finiteOr(body.getLinearVelocity(), glm::vec3(0.f));

        // Direct velocity edit: sideways slip decays exponentially instead of being
        // resisted by a friction force
        glm::vec3 local = glm::inverse(orientation) * velocity;
        if (outBefore) *outBefore = local.x;

        local.x = glm::mix(local.x, 0.f, clamp01(m_tuning.gripStrength * dt));
        if (outAfter) *outAfter = local.x;

        body.setLinearVelocity(orientation * local);
        return true;
    }

    glm::vec3 ForceShaper::applyDownforce(IRigidBody& body, const VehicleState& state) const
    {
        if (!state.isGrounded) return glm::vec3(0.f);

        const float speed = std::abs(state.forwardSpeed);
        const float magnitude = (m_tuning.baseDownforce + speed * m_tuning.downforceSpeedMultiplier)
            * state.gripFactor;
        if (magnitude == 0.f) return glm::vec3(0.f);

        const glm::vec3 force = -WORLD_UP * magnitude;
        body.addForce(force, ForceMode::Acceleration);
        return force;
    }

    glm::vec3 ForceShaper::applyUpright(IRigidBody& body, const VehicleState& state, float dt,
        bool* outDamped) const
    {
        if (!state.isGrounded && !m_tuning.airborneUpright) return glm::vec3(0.f);

        const glm::vec3 targetUp = state.isGrounded ? state.groundNormal : WORLD_UP;
        const glm::vec3 currentUp = finiteOr(body.getOrientation()) * WORLD_UP;

        const glm::vec3 torque = glm::cross(currentUp, targetUp) * m_tuning.uprightTorqueGain;
        if (glm::dot(torque, torque) > 0.f)
            body.addTorque(torque, ForceMode::Acceleration);

        // Extra angular damping keeps the bias from overshooting into oscillation
        const glm::vec3 angularVelocity = finiteOr(body.getAngularVelocity(), glm::vec3(0.f));
        body.setAngularVelocity(angularVelocity * clamp01(1.f - m_tuning.uprightAngularDamping * dt));
        if (outDamped) *outDamped = true;

        return torque;
    }

    bool ForceShaper::isInverted(const glm::vec3& bodyUp, float threshold)
    {
        return glm::dot(bodyUp, WORLD_UP) < threshold;
    }

    glm::vec3 ForceShaper::applyInversionRecovery(IRigidBody& body, const VehicleState& state) const
    {
        if (!state.isGrounded) return glm::vec3(0.f);

        const glm::quat orientation = finiteOr(body.getOrientation());
        const glm::vec3 bodyUp = orientation * WORLD_UP;
        if (!isInverted(bodyUp, m_tuning.invertedThreshold)) return glm::vec3(0.f);

        // Only biases toward upright; finishing the flip needs momentum or input.
        glm::vec3 axis = glm::cross(bodyUp, WORLD_UP);
        if (glm::length(axis) < 1e-3f) {
            // Lying exactly on the roof: the cross product vanishes, roll about forward
            axis = orientation * LOCAL_FORWARD;
        }

        const glm::vec3 torque = axis * (m_tuning.recoveryTorqueGain * state.gripFactor);
        body.addTorque(torque, ForceMode::Acceleration);
        return torque;
    }

    bool ForceShaper::applyAirborneAngularCap(IRigidBody& body, const VehicleState& state) const
    {
        if (state.isGrounded) return false;

        const glm::vec3 angularVelocity = finiteOr(body.getAngularVelocity(), glm::vec3(0.f));
        if (glm::length(angularVelocity) <= m_tuning.airborneAngularCap) return false;

        body.setAngularVelocity(clampMagnitude(angularVelocity, m_tuning.airborneAngularCap));
        return true;
    }

    bool ForceShaper::applySpeedClamp(IRigidBody& body) const
    {
        const glm::vec3 velocity = finiteOr(body.getLinearVelocity(), glm::vec3(0.f));

        // Vertical is left untouched so jumps and falls keep their arc
        const glm::vec2 horizontal{ velocity.x, velocity.z };
        const float speed = glm::length(horizontal);
        if (speed <= m_tuning.maxSpeed) return false;

        const glm::vec2 clamped = horizontal * (m_tuning.maxSpeed / speed);
        body.setLinearVelocity(glm::vec3(clamped.x, velocity.y, clamped.y));
        return true;
    }

}
