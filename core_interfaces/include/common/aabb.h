#pragma once
#include <glm/glm.hpp>

struct Aabb {
    glm::vec3 min{ 0.f };
    glm::vec3 max{ 0.f };

    static Aabb fromCenterExtents(const glm::vec3& center, const glm::vec3& extents) {
        return Aabb{ center - extents, center + extents };
    }

    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 extents() const { return (max - min) * 0.5f; }
    float halfHeight() const { return (max.y - min.y) * 0.5f; }

    bool isDegenerate() const { return max.x <= min.x && max.y <= min.y && max.z <= min.z; }

    void encapsulate(const Aabb& other) {
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }
};
