#pragma once
#include "interfaces/geometry_source_i.h"
#include "physics/px_rigid_body.h"
#include <memory>

// World bounds of every shape on the body's actor. Demo vehicles are built
// from their collision boxes, so shape bounds stand in for visual bounds.
class PxGeometrySource final : public IGeometrySource {
public:
    explicit PxGeometrySource(std::shared_ptr<PxRigidBodyAdapter> body) : m_body(std::move(body)) {}

    std::vector<Aabb> getWorldBounds() const override;

private:
    std::shared_ptr<PxRigidBodyAdapter> m_body;
};
