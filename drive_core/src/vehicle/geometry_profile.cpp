#include "common/drive_pch.h"
#include "vehicle/geometry_profile.h"
#include "vehicle/mass_properties.h"
#include "geometry/bounds_probe.h"

namespace Drive {

    float groundRayLengthFor(const Aabb& worldBounds, const DriveTuning& tuning)
    {
        float halfHeight = worldBounds.halfHeight();
        if (!std::isfinite(halfHeight) || halfHeight < 0.f)
            halfHeight = 0.f;

        return std::max(halfHeight + tuning.groundRayMargin, tuning.minGroundRayLength);
    }

    GeometryProfile makeGeometryProfile(
        const std::vector<Aabb>& visualParts,
        const glm::vec3& bodyOrigin,
        const DriveTuning& tuning)
    {
        GeometryProfile profile;
        profile.worldBounds = computeBounds(visualParts, bodyOrigin);
        profile.groundRayLength = groundRayLengthFor(profile.worldBounds, tuning);
        profile.centerOfMassOffset = lowerCenterOfMass(profile.worldBounds, tuning.centerOfMassHeightBias);
        return profile;
    }

}
