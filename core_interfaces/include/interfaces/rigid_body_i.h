#pragma once
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>

// Mirrors the physics engine force modes. Acceleration and VelocityChange ignore mass.
enum class ForceMode : uint8_t {
    Force = 0,
    Acceleration,
    Impulse,
    VelocityChange
};

enum class BodyInterpolation : uint8_t {
    None = 0,
    Interpolate
};

// IRigidBody is the slice of a physics engine rigid body the drive layer reads and writes.
// Velocity setters take effect immediately, forces and torques are queued until the next step.
struct IRigidBody {
    virtual ~IRigidBody() = default;

    virtual glm::vec3 getPosition() const = 0;
    virtual glm::quat getOrientation() const = 0;

    virtual glm::vec3 getLinearVelocity() const = 0;
    virtual void setLinearVelocity(const glm::vec3& velocity) = 0;
    virtual glm::vec3 getAngularVelocity() const = 0;
    virtual void setAngularVelocity(const glm::vec3& velocity) = 0;

    virtual float getMass() const = 0;
    virtual bool hasCollider() const = 0;

    // Center of mass in body-local space
    virtual glm::vec3 getCenterOfMassOffset() const = 0;
    virtual void setCenterOfMassOffset(const glm::vec3& offset) = 0;
    virtual glm::vec3 getWorldCenterOfMass() const = 0;

    virtual void setLinearDamping(float damping) = 0;
    virtual void setAngularDamping(float damping) = 0;
    virtual void setInterpolation(BodyInterpolation mode) = 0;

    virtual void addForce(const glm::vec3& force, ForceMode mode) = 0;
    virtual void addTorque(const glm::vec3& torque, ForceMode mode) = 0;
};
