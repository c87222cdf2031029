#include "common/drive_pch.h"
#include "vehicle/mass_properties.h"

namespace Drive {

    glm::vec3 lowerCenterOfMass(const Aabb& worldBounds, float heightBias)
    {
        const float halfHeight = worldBounds.halfHeight();
        if (!std::isfinite(halfHeight) || halfHeight <= 0.f)
            return glm::vec3(0.f);

        return glm::vec3(0.f, -halfHeight * heightBias, 0.f);
    }

}
