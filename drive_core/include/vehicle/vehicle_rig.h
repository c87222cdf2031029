#pragma once
#include "interfaces/rigid_body_i.h"
#include "interfaces/physics_query_i.h"
#include "interfaces/geometry_source_i.h"
#include "interfaces/vehicle_input_i.h"
#include "control/drive_tuning.h"
#include "control/force_shaper.h"
#include "input/vehicle_input.h"
#include "sensing/ground_sensor.h"
#include "vehicle/geometry_profile.h"
#include "vehicle/vehicle_state.h"

#include <memory>
#include <optional>

namespace Drive {

    enum class BindStatus : uint8_t {
        Ok = 0,
        NullBody,
        InvalidMass,
        MissingCollider
    };

    const char* toString(BindStatus status);

    // The driven body and everything derived from it. Never mutated once built;
    // rebinding swaps the whole pair.
    struct VehicleBinding {
        std::shared_ptr<IRigidBody> body;
        GeometryProfile profile;
        glm::vec3 originalCenterOfMass{ 0.f };
    };

    // VehicleRig binds one rigid body at a time and runs the per-tick sequence:
    // state refresh, then the force shaper. A bind or unbind requested while a tick
    // is running takes effect at the start of the next tick. One made between ticks
    // acts at once and drops whatever was staged.
    class VehicleRig {
    public:
        VehicleRig(const DriveTuning& tuning, const IPhysicsQuery* query);
        ~VehicleRig();

        VehicleRig(const VehicleRig&) = delete;
        VehicleRig& operator=(const VehicleRig&) = delete;
        VehicleRig(VehicleRig&&) = delete;
        VehicleRig& operator=(VehicleRig&&) = delete;

        // Rejected binds leave the current binding in place
        BindStatus bind(std::shared_ptr<IRigidBody> body, const IGeometrySource* geometry);
        void unbind();

        void setInputSource(std::shared_ptr<IVehicleInput> source) { m_input.setSource(std::move(source)); }
        InputRouter& getInputRouter() { return m_input; }

        // One fixed step. Returns nothing when no body is bound and the tick was skipped.
        std::optional<ShapingReport> fixedUpdate(float dt);

        bool isBound() const { return m_binding != nullptr; }
        std::shared_ptr<IRigidBody> getBody() const { return m_binding ? m_binding->body : nullptr; }
        const GeometryProfile* getGeometryProfile() const { return m_binding ? &m_binding->profile : nullptr; }
        const VehicleState& getLastState() const { return m_lastState; }
        const GroundSensor& getGroundSensor() const { return m_groundSensor; }
        const DriveTuning& getTuning() const { return m_tuning; }

    private:
        void installBinding(std::shared_ptr<const VehicleBinding> binding);
        void releaseBinding();
        void applyPending();

        DriveTuning  m_tuning;
        GroundSensor m_groundSensor;
        ForceShaper  m_shaper;
        InputRouter  m_input;

        std::shared_ptr<const VehicleBinding> m_binding;
        std::shared_ptr<const VehicleBinding> m_pendingBinding;
        bool m_pendingUnbind = false;
        bool m_inTick = false;

        VehicleState m_lastState{};

        bool m_reportedNoBody = false;
        bool m_reportedNoInput = false;
        bool m_reportedInputFailure = false;
        bool m_reportedStateFailure = false;
    };

}
