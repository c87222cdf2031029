#pragma once
#include "common/aabb.h"
#include <glm/glm.hpp>
#include <vector>

namespace Drive {

    // Smallest world-space box enclosing all parts. An empty list (or one with no
    // finite part) yields a zero-size box at bodyOrigin, which downstream code
    // treats as unknown size.
    Aabb computeBounds(const std::vector<Aabb>& parts, const glm::vec3& bodyOrigin);

}
