#pragma once
#include "interfaces/rigid_body_i.h"
#include <PxPhysicsAPI.h>
#include <glm/glm.hpp>

// IRigidBody over a PxRigidDynamic. After invalidate() (actor released by the
// world) every call throws std::runtime_error.
class PxRigidBodyAdapter final : public IRigidBody {
public:
    explicit PxRigidBodyAdapter(physx::PxRigidDynamic* actor);

    PxRigidBodyAdapter(const PxRigidBodyAdapter&) = delete;
    PxRigidBodyAdapter& operator=(const PxRigidBodyAdapter&) = delete;

    glm::vec3 getPosition() const override;
    glm::quat getOrientation() const override;

    glm::vec3 getLinearVelocity() const override;
    void setLinearVelocity(const glm::vec3& velocity) override;
    glm::vec3 getAngularVelocity() const override;
    void setAngularVelocity(const glm::vec3& velocity) override;

    float getMass() const override;
    bool hasCollider() const override;

    glm::vec3 getCenterOfMassOffset() const override;
    void setCenterOfMassOffset(const glm::vec3& offset) override;
    glm::vec3 getWorldCenterOfMass() const override;

    void setLinearDamping(float damping) override;
    void setAngularDamping(float damping) override;
    void setInterpolation(BodyInterpolation mode) override;

    void addForce(const glm::vec3& force, ForceMode mode) override;
    void addTorque(const glm::vec3& torque, ForceMode mode) override;

    // Called by the world right before each simulate
    void capturePreviousPose();
    // Blend between the previous and current pose; alpha in [0, 1]
    glm::vec3 getInterpolatedPosition(float alpha) const;

    physx::PxRigidDynamic* getActor() const { return m_actor; }
    bool isValid() const { return m_actor != nullptr; }
    void invalidate() { m_actor = nullptr; }

private:
    physx::PxRigidDynamic& actor() const;

    physx::PxRigidDynamic* m_actor = nullptr;
    BodyInterpolation      m_interpolation = BodyInterpolation::None;
    physx::PxTransform     m_previousPose{ physx::PxIdentity };
};
