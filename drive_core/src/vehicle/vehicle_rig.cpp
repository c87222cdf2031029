#include "common/drive_pch.h"
#include "vehicle/vehicle_rig.h"
#include "common/drive_math.h"

namespace Drive {

    const char* toString(BindStatus status)
    {
        switch (status) {
        case BindStatus::Ok:              return "ok";
        case BindStatus::NullBody:        return "null body";
        case BindStatus::InvalidMass:     return "body has no valid mass";
        case BindStatus::MissingCollider: return "body has no collider";
        default:                          return "unknown";
        }
    }

    namespace {
        DriveTuning validated(DriveTuning tuning) {
            for (const auto& issue : tuning.validate()) {
                spdlog::warn("[VehicleRig] Tuning corrected: {}", issue);
            }
            return tuning;
        }

        // Clears the in-tick flag on every exit path
        struct TickScope {
            explicit TickScope(bool& flag) : m_flag(flag) { m_flag = true; }
            ~TickScope() { m_flag = false; }
            bool& m_flag;
        };
    }

    VehicleRig::VehicleRig(const DriveTuning& tuning, const IPhysicsQuery* query)
        : m_tuning(validated(tuning))
        , m_groundSensor(query, m_tuning)
        , m_shaper(m_tuning)
    {
        m_groundSensor.setRayLength(m_tuning.minGroundRayLength);
    }

    VehicleRig::~VehicleRig()
    {
        releaseBinding();
    }

    BindStatus VehicleRig::bind(std::shared_ptr<IRigidBody> body, const IGeometrySource* geometry)
    {
        BindStatus status = BindStatus::Ok;
        if (!body) {
            status = BindStatus::NullBody;
        }
        else {
            const float mass = body->getMass();
            if (!std::isfinite(mass) || mass <= 0.f)
                status = BindStatus::InvalidMass;
            else if (!body->hasCollider())
                status = BindStatus::MissingCollider;
        }

        if (status != BindStatus::Ok) {
            spdlog::error("[VehicleRig] bind rejected: {} (keeping {} binding)",
                toString(status), m_binding ? "current" : "no");
            return status;
        }

        std::vector<Aabb> parts;
        if (geometry) {
            try {
                parts = geometry->getWorldBounds();
            }
            catch (const std::exception& e) {
                spdlog::warn("[VehicleRig] Geometry query failed, using unknown size: {}", e.what());
                parts.clear();
            }
        }
        if (parts.empty())
            spdlog::warn("[VehicleRig] No visual bounds for bound body, falling back to minimum ray length");

        auto binding = std::make_shared<VehicleBinding>();
        binding->body = std::move(body);
        binding->profile = makeGeometryProfile(parts, binding->body->getPosition(), m_tuning);
        binding->originalCenterOfMass = binding->body->getCenterOfMassOffset();

        // Rebinding the same body keeps the offset it had before it was first driven
        if (m_binding && m_binding->body == binding->body)
            binding->originalCenterOfMass = m_binding->originalCenterOfMass;

        if (m_inTick) {
            m_pendingBinding = std::move(binding);
            m_pendingUnbind = false;
            spdlog::debug("[VehicleRig] bind requested mid-tick, deferred to next tick");
        }
        else {
            // A direct bind supersedes anything staged by an earlier tick
            m_pendingBinding.reset();
            m_pendingUnbind = false;
            installBinding(std::move(binding));
        }
        return BindStatus::Ok;
    }

    void VehicleRig::unbind()
    {
        if (m_inTick) {
            m_pendingBinding.reset();
            m_pendingUnbind = true;
            return;
        }
        m_pendingBinding.reset();
        m_pendingUnbind = false;
        releaseBinding();
    }

    void VehicleRig::installBinding(std::shared_ptr<const VehicleBinding> binding)
    {
        if (m_binding && m_binding->body != binding->body)
            releaseBinding();

        IRigidBody& body = *binding->body;
        body.setCenterOfMassOffset(binding->profile.centerOfMassOffset);
        body.setAngularDamping(m_tuning.bodyAngularDamping);
        body.setLinearDamping(m_tuning.bodyLinearDamping);
        body.setInterpolation(BodyInterpolation::Interpolate);

        m_groundSensor.setRayLength(binding->profile.groundRayLength);
        m_binding = std::move(binding);
        m_reportedNoBody = false;

        const Aabb& b = m_binding->profile.worldBounds;
        spdlog::info("[VehicleRig] Bound body: extents=({:.2f}, {:.2f}, {:.2f}) ray={:.2f} com_y={:.2f}",
            b.extents().x, b.extents().y, b.extents().z,
            m_binding->profile.groundRayLength,
            m_binding->profile.centerOfMassOffset.y);
    }

    void VehicleRig::releaseBinding()
    {
        if (!m_binding) return;

        try {
            m_binding->body->setCenterOfMassOffset(m_binding->originalCenterOfMass);
        }
        catch (const std::exception& e) {
            spdlog::warn("[VehicleRig] Could not restore center of mass on release: {}", e.what());
        }

        m_binding.reset();
        m_groundSensor.setRayLength(m_tuning.minGroundRayLength);
        spdlog::info("[VehicleRig] Body released");
    }

    void VehicleRig::applyPending()
    {
        if (m_pendingUnbind) {
            m_pendingUnbind = false;
            releaseBinding();
        }
        if (m_pendingBinding) {
            installBinding(std::move(m_pendingBinding));
            m_pendingBinding.reset();
        }
    }

    std::optional<ShapingReport> VehicleRig::fixedUpdate(float dt)
    {
        applyPending();

        if (!m_binding) {
            if (!m_reportedNoBody) {
                spdlog::warn("[VehicleRig] No rigid body bound, skipping ticks until one is");
                m_reportedNoBody = true;
            }
            return std::nullopt;
        }

        TickScope scope(m_inTick);

        // Hold the pair for the whole tick even if a bind lands mid-tick
        const std::shared_ptr<const VehicleBinding> binding = m_binding;
        IRigidBody& body = *binding->body;

        DriveCommand command{};
        if (!m_input.hasSource()) {
            if (!m_reportedNoInput) {
                spdlog::warn("[VehicleRig] No input source bound, driving with zero throttle and steering");
                m_reportedNoInput = true;
            }
        }
        else {
            m_reportedNoInput = false;
            try {
                command = m_input.poll(dt);
                m_reportedInputFailure = false;
            }
            catch (const std::exception& e) {
                if (!m_reportedInputFailure) {
                    spdlog::error("[VehicleRig] Input source '{}' failed, using zero input: {}",
                        m_input.getSource()->getName(), e.what());
                    m_reportedInputFailure = true;
                }
            }
        }

        try {
            m_lastState = refreshVehicleState(body, m_groundSensor, m_tuning);
            m_reportedStateFailure = false;
        }
        catch (const std::exception& e) {
            if (!m_reportedStateFailure) {
                spdlog::error("[VehicleRig] State refresh failed, treating tick as airborne: {}", e.what());
                m_reportedStateFailure = true;
            }
            m_lastState = deriveVehicleState(glm::vec3(0.f), false, WORLD_UP, m_tuning);
        }

        ShapingReport report = m_shaper.apply(body, m_lastState, command, dt);

        spdlog::debug("[VehicleRig] {} v_fwd={:.2f} v_lat={:.2f} grip={:.2f} throttle={:.2f} steer={:.2f}",
            toString(report.regime), m_lastState.forwardSpeed, m_lastState.lateralSpeed,
            m_lastState.gripFactor, command.throttle, command.steering);

        return report;
    }

}
