#include "common/drive_pch.h"
#include "sensing/ground_sensor.h"
#include "vehicle/geometry_profile.h"
#include "common/drive_math.h"

namespace Drive {

    GroundSensor::GroundSensor(const IPhysicsQuery* query, const DriveTuning& tuning)
        : m_query(query)
        , m_tuning(tuning)
        , m_rayLength(tuning.minGroundRayLength)
    {
    }

    void GroundSensor::configure(const Aabb& worldBounds)
    {
        setRayLength(groundRayLengthFor(worldBounds, m_tuning));
    }

    void GroundSensor::setRayLength(float rayLength)
    {
        if (!std::isfinite(rayLength))
            rayLength = m_tuning.minGroundRayLength;
        m_rayLength = std::max(rayLength, m_tuning.minGroundRayLength);
    }

    void GroundSensor::update(const glm::vec3& originPoint, const glm::vec3& downDirection,
        const IRigidBody* ignoreBody)
    {
        if (!m_query) {
            if (!m_reportedMissingQuery) {
                spdlog::warn("[GroundSensor] No physics query bound, vehicle reads as airborne");
                m_reportedMissingQuery = true;
            }
            setMiss();
            return;
        }
        m_reportedMissingQuery = false;

        const float dirLength = glm::length(downDirection);
        if (!isFinite(originPoint) || !std::isfinite(dirLength) || dirLength < 1e-6f) {
            setMiss();
            return;
        }
        const glm::vec3 direction = downDirection / dirLength;

        std::optional<RaycastHit> hit;
        try {
            hit = m_query->raycast(originPoint, direction, m_rayLength, ignoreBody);
        }
        catch (const std::exception& e) {
            if (!m_reportedQueryFailure) {
                spdlog::error("[GroundSensor] Raycast failed, treating as miss: {}", e.what());
                m_reportedQueryFailure = true;
            }
            setMiss();
            return;
        }
        m_reportedQueryFailure = false;

        if (!hit || !isFinite(hit->normal) || glm::length(hit->normal) < 1e-6f) {
            setMiss();
            return;
        }

        m_isGrounded = true;
        m_groundNormal = glm::normalize(hit->normal);
        m_hitDistance = hit->distance;
    }

    void GroundSensor::setMiss()
    {
        m_isGrounded = false;
        m_groundNormal = WORLD_UP;
        m_hitDistance = 0.f;
    }

}
