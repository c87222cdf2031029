#include "physics/px_rigid_body.h"
#include "physics/px_convert.h"
#include <vector>
#include <stdexcept>

using namespace physx;

static PxForceMode::Enum toPxForceMode(ForceMode mode) {
    switch (mode) {
    case ForceMode::Force:          return PxForceMode::eFORCE;
    case ForceMode::Acceleration:   return PxForceMode::eACCELERATION;
    case ForceMode::Impulse:        return PxForceMode::eIMPULSE;
    case ForceMode::VelocityChange: return PxForceMode::eVELOCITY_CHANGE;
    default:                        return PxForceMode::eACCELERATION;
    }
}

PxRigidBodyAdapter::PxRigidBodyAdapter(PxRigidDynamic* actor)
    : m_actor(actor)
{
    if (m_actor) m_previousPose = m_actor->getGlobalPose();
}

PxRigidDynamic& PxRigidBodyAdapter::actor() const {
    if (!m_actor)
        throw std::runtime_error("PxRigidBodyAdapter: actor was released");
    return *m_actor;
}

glm::vec3 PxRigidBodyAdapter::getPosition() const {
    return pxToGlm(actor().getGlobalPose().p);
}

glm::quat PxRigidBodyAdapter::getOrientation() const {
    return pxToGlm(actor().getGlobalPose().q);
}

glm::vec3 PxRigidBodyAdapter::getLinearVelocity() const {
    return pxToGlm(actor().getLinearVelocity());
}

void PxRigidBodyAdapter::setLinearVelocity(const glm::vec3& velocity) {
    actor().setLinearVelocity(glmToPx(velocity));
}

glm::vec3 PxRigidBodyAdapter::getAngularVelocity() const {
    return pxToGlm(actor().getAngularVelocity());
}

void PxRigidBodyAdapter::setAngularVelocity(const glm::vec3& velocity) {
    actor().setAngularVelocity(glmToPx(velocity));
}

float PxRigidBodyAdapter::getMass() const {
    return actor().getMass();
}

bool PxRigidBodyAdapter::hasCollider() const {
    PxRigidDynamic& a = actor();
    const PxU32 count = a.getNbShapes();
    if (count == 0) return false;

    std::vector<PxShape*> shapes(count);
    a.getShapes(shapes.data(), count);
    for (PxShape* shape : shapes) {
        if (shape->getFlags().isSet(PxShapeFlag::eSIMULATION_SHAPE))
            return true;
    }
    return false;
}

glm::vec3 PxRigidBodyAdapter::getCenterOfMassOffset() const {
    return pxToGlm(actor().getCMassLocalPose().p);
}

void PxRigidBodyAdapter::setCenterOfMassOffset(const glm::vec3& offset) {
    PxRigidDynamic& a = actor();
    PxTransform pose = a.getCMassLocalPose();
    pose.p = glmToPx(offset);
    a.setCMassLocalPose(pose);
}

glm::vec3 PxRigidBodyAdapter::getWorldCenterOfMass() const {
    PxRigidDynamic& a = actor();
    return pxToGlm(a.getGlobalPose().transform(a.getCMassLocalPose().p));
}

void PxRigidBodyAdapter::setLinearDamping(float damping) {
    actor().setLinearDamping(damping);
}

void PxRigidBodyAdapter::setAngularDamping(float damping) {
    actor().setAngularDamping(damping);
}

void PxRigidBodyAdapter::setInterpolation(BodyInterpolation mode) {
    m_interpolation = mode;
    m_previousPose = actor().getGlobalPose();
}

void PxRigidBodyAdapter::addForce(const glm::vec3& force, ForceMode mode) {
    actor().addForce(glmToPx(force), toPxForceMode(mode));
}

void PxRigidBodyAdapter::addTorque(const glm::vec3& torque, ForceMode mode) {
    actor().addTorque(glmToPx(torque), toPxForceMode(mode));
}

void PxRigidBodyAdapter::capturePreviousPose() {
    if (m_actor) m_previousPose = m_actor->getGlobalPose();
}

glm::vec3 PxRigidBodyAdapter::getInterpolatedPosition(float alpha) const {
    const glm::vec3 current = getPosition();
    if (m_interpolation == BodyInterpolation::None) return current;

    return glm::mix(pxToGlm(m_previousPose.p), current, glm::clamp(alpha, 0.f, 1.f));
}
