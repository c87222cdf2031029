#pragma once
#include <glm/glm.hpp>
#include <optional>

struct IRigidBody;

struct RaycastHit {
    glm::vec3 point{ 0.f };
    glm::vec3 normal{ 0.f, 1.f, 0.f };
    float distance = 0.f;
};

struct IPhysicsQuery {
    virtual ~IPhysicsQuery() = default;

    // direction must be normalized. ignoreBody (may be null) is excluded from the query.
    virtual std::optional<RaycastHit> raycast(
        const glm::vec3& origin,
        const glm::vec3& direction,
        float maxDistance,
        const IRigidBody* ignoreBody) const = 0;
};
