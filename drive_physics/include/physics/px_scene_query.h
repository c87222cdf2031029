#pragma once
#include "interfaces/physics_query_i.h"
#include <PxPhysicsAPI.h>

// Raycasts against a PxScene. The ignored body is filtered out before narrow phase.
class PxSceneQuery final : public IPhysicsQuery {
public:
    explicit PxSceneQuery(physx::PxScene* scene) : m_scene(scene) {}

    std::optional<RaycastHit> raycast(
        const glm::vec3& origin,
        const glm::vec3& direction,
        float maxDistance,
        const IRigidBody* ignoreBody) const override;

    void setScene(physx::PxScene* scene) { m_scene = scene; }

private:
    physx::PxScene* m_scene = nullptr;
};
