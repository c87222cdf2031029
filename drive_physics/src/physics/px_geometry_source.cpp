#include "physics/px_geometry_source.h"
#include "physics/px_convert.h"
#include <extensions/PxShapeExt.h>

using namespace physx;

std::vector<Aabb> PxGeometrySource::getWorldBounds() const
{
    std::vector<Aabb> out;
    if (!m_body || !m_body->isValid()) return out;

    PxRigidDynamic* actor = m_body->getActor();
    const PxU32 count = actor->getNbShapes();
    std::vector<PxShape*> shapes(count);
    actor->getShapes(shapes.data(), count);

    out.reserve(count);
    for (PxShape* shape : shapes) {
        out.push_back(pxToAabb(PxShapeExt::getWorldBounds(*shape, *actor)));
    }
    return out;
}
