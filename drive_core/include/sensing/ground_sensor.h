#pragma once
#include "interfaces/physics_query_i.h"
#include "common/aabb.h"
#include "control/drive_tuning.h"
#include <glm/glm.hpp>

struct IRigidBody;

namespace Drive {

    // Single downward ray under the center of mass. A miss, a missing query service
    // or a failing raycast all read as "not grounded"; nothing escapes update().
    class GroundSensor {
    public:
        GroundSensor(const IPhysicsQuery* query, const DriveTuning& tuning);
        GroundSensor(const IPhysicsQuery* query, DriveTuning&&) = delete;

        void configure(const Aabb& worldBounds);
        void setRayLength(float rayLength);

        void update(const glm::vec3& originPoint, const glm::vec3& downDirection,
            const IRigidBody* ignoreBody = nullptr);

        void setQuery(const IPhysicsQuery* query) { m_query = query; }

        bool isGrounded() const { return m_isGrounded; }
        glm::vec3 getGroundNormal() const { return m_groundNormal; }
        float getRayLength() const { return m_rayLength; }
        float getHitDistance() const { return m_hitDistance; }

    private:
        void setMiss();

        const IPhysicsQuery* m_query = nullptr;
        const DriveTuning&   m_tuning;

        bool      m_isGrounded = false;
        glm::vec3 m_groundNormal{ 0.f, 1.f, 0.f };
        float     m_rayLength = 0.f;
        float     m_hitDistance = 0.f;

        bool m_reportedMissingQuery = false;
        bool m_reportedQueryFailure = false;
    };

}
