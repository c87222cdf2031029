#pragma once
#include <PxPhysicsAPI.h>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include "common/aabb.h"

static inline physx::PxVec3 glmToPx(const glm::vec3& v) { return physx::PxVec3(v.x, v.y, v.z); }
static inline glm::vec3 pxToGlm(const physx::PxVec3& v) { return glm::vec3(v.x, v.y, v.z); }

static inline physx::PxQuat glmToPx(const glm::quat& q) { return physx::PxQuat(q.x, q.y, q.z, q.w); }
static inline glm::quat pxToGlm(const physx::PxQuat& q) { return glm::quat(q.w, q.x, q.y, q.z); }

static inline physx::PxTransform glmToPxTransform(const glm::vec3& position, const glm::quat& rotation) {
    return physx::PxTransform(glmToPx(position), glmToPx(glm::normalize(rotation)));
}

static inline Aabb pxToAabb(const physx::PxBounds3& b) {
    return Aabb{ pxToGlm(b.minimum), pxToGlm(b.maximum) };
}
