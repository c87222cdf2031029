#pragma once
#include "common/aabb.h"
#include <vector>

// Supplies the world-space bounds of every visual part of a vehicle.
struct IGeometrySource {
    virtual ~IGeometrySource() = default;
    virtual std::vector<Aabb> getWorldBounds() const = 0;
};
