#pragma once
#include "common/aabb.h"
#include "control/drive_tuning.h"
#include <glm/glm.hpp>
#include <vector>

namespace Drive {

    // Derived once per binding, never mutated afterwards
    struct GeometryProfile {
        Aabb worldBounds{};
        float groundRayLength = 0.f;
        glm::vec3 centerOfMassOffset{ 0.f };
    };

    float groundRayLengthFor(const Aabb& worldBounds, const DriveTuning& tuning);

    GeometryProfile makeGeometryProfile(
        const std::vector<Aabb>& visualParts,
        const glm::vec3& bodyOrigin,
        const DriveTuning& tuning);

}
