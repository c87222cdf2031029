#pragma once
#include <memory>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <spdlog/spdlog.h>
#include <PxPhysicsAPI.h>

#include "physics/px_rigid_body.h"
#include "physics/px_scene_query.h"


struct BoxPart {
    glm::vec3 center{ 0.f };        // body-local
    glm::vec3 halfExtents{ 0.5f };
};

struct DynamicBodyDesc {
    std::vector<BoxPart> parts;
    float mass = 1000.f;
    glm::vec3 position{ 0.f };
    glm::quat rotation{ 1.f, 0.f, 0.f, 0.f };
};


class PhysicsWorld {
public:
    PhysicsWorld() = default;
    ~PhysicsWorld();
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;
    PhysicsWorld(PhysicsWorld&&) = delete;
    PhysicsWorld& operator=(PhysicsWorld&&) = delete;

    void initPhysx(int workerThreads = 2);
    void stepSimulation(float deltaTime);

    physx::PxRigidStatic* createGroundPlane(float height = 0.f);
    physx::PxRigidStatic* createStaticBox(
        const glm::vec3& position,
        const glm::quat& rotation,
        const glm::vec3& halfExtents);

    // Compound of boxes with the given total mass. Throws when PhysX refuses a part.
    std::shared_ptr<PxRigidBodyAdapter> createDynamicBody(const DynamicBodyDesc& desc);
    void destroyBody(const std::shared_ptr<PxRigidBodyAdapter>& body);

    const IPhysicsQuery& getQuery() const { return *m_query; }
    physx::PxScene* getScene() const { return m_scene; }

private:
    physx::PxFoundation* m_foundation = nullptr;
    physx::PxPhysics* m_physics = nullptr;
    physx::PxScene* m_scene = nullptr;
    physx::PxDefaultCpuDispatcher* m_dispatcher = nullptr;

    physx::PxMaterial* m_defaultMaterial = nullptr;

    physx::PxDefaultAllocator m_allocator;
    physx::PxDefaultErrorCallback m_errorCallback;

    std::unique_ptr<PxSceneQuery> m_query = std::make_unique<PxSceneQuery>(nullptr);
    std::vector<std::shared_ptr<PxRigidBodyAdapter>> m_bodies;
};
