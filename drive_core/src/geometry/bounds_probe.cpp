#include "common/drive_pch.h"
#include "geometry/bounds_probe.h"
#include "common/drive_math.h"

namespace Drive {

    Aabb computeBounds(const std::vector<Aabb>& parts, const glm::vec3& bodyOrigin)
    {
        std::optional<Aabb> bounds;

        for (const auto& part : parts) {
            if (!isFinite(part.min) || !isFinite(part.max))
                continue;

            // Tolerate parts reported with swapped corners
            Aabb ordered{ glm::min(part.min, part.max), glm::max(part.min, part.max) };

            if (!bounds) bounds = ordered;
            else bounds->encapsulate(ordered);
        }

        if (!bounds) {
            const glm::vec3 origin = finiteOr(bodyOrigin, glm::vec3(0.f));
            return Aabb{ origin, origin };
        }
        return *bounds;
    }

}
