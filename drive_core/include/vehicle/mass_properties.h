#pragma once
#include "common/aabb.h"
#include <glm/glm.hpp>

namespace Drive {

    // Body-local center-of-mass offset, lowered by heightBias of the half height.
    // Lowering it raises the restoring torque against tipping for tall shapes.
    glm::vec3 lowerCenterOfMass(const Aabb& worldBounds, float heightBias);

}
