#include "physics/px_scene_query.h"
#include "physics/px_rigid_body.h"
#include "physics/px_convert.h"
#include <stdexcept>

using namespace physx;

namespace {

    class IgnoreActorFilter final : public PxQueryFilterCallback {
    public:
        explicit IgnoreActorFilter(const PxRigidActor* ignored) : m_ignored(ignored) {}

        PxQueryHitType::Enum preFilter(const PxFilterData&, const PxShape*,
            const PxRigidActor* actor, PxHitFlags&) override
        {
            return actor == m_ignored ? PxQueryHitType::eNONE : PxQueryHitType::eBLOCK;
        }

        PxQueryHitType::Enum postFilter(const PxFilterData&, const PxQueryHit&,
            const PxShape*, const PxRigidActor*) override
        {
            return PxQueryHitType::eBLOCK;
        }

    private:
        const PxRigidActor* m_ignored;
    };

}

std::optional<RaycastHit> PxSceneQuery::raycast(
    const glm::vec3& origin,
    const glm::vec3& direction,
    float maxDistance,
    const IRigidBody* ignoreBody) const
{
    if (!m_scene)
        throw std::runtime_error("PxSceneQuery: no scene");

    const PxRigidActor* ignored = nullptr;
    if (const auto* adapter = dynamic_cast<const PxRigidBodyAdapter*>(ignoreBody))
        ignored = adapter->getActor();

    IgnoreActorFilter filter(ignored);
    PxQueryFilterData filterData(PxQueryFlag::eSTATIC | PxQueryFlag::eDYNAMIC | PxQueryFlag::ePREFILTER);

    PxRaycastBuffer hitBuffer;
    const bool hasHit = m_scene->raycast(
        glmToPx(origin),
        glmToPx(direction),
        maxDistance,
        hitBuffer,
        PxHitFlag::ePOSITION | PxHitFlag::eNORMAL,
        filterData,
        &filter);

    if (!hasHit || !hitBuffer.hasBlock)
        return std::nullopt;

    RaycastHit hit;
    hit.point = pxToGlm(hitBuffer.block.position);
    hit.normal = pxToGlm(hitBuffer.block.normal);
    hit.distance = hitBuffer.block.distance;
    return hit;
}
