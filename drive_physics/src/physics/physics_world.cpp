#include "physics/physics_world.h"
#include "physics/px_convert.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <PxPhysicsAPI.h>
#include <extensions/PxRigidBodyExt.h>

using namespace physx;


void PhysicsWorld::initPhysx(int workerThreads) {
    if (m_foundation) return; // already initialized

    // Foundation
    m_foundation = PxCreateFoundation(PX_PHYSICS_VERSION, m_allocator, m_errorCallback);
    if (!m_foundation) {
        throw std::runtime_error("PxCreateFoundation failed");
    }

    // Physics
    PxTolerancesScale toleranceScale;
    m_physics = PxCreatePhysics(PX_PHYSICS_VERSION, *m_foundation, toleranceScale);
    if (!m_physics)
        throw std::runtime_error("PxCreatePhysics failed");

    const int threads = std::max(1, workerThreads);
    m_dispatcher = PxDefaultCpuDispatcherCreate(threads);
    if (!m_dispatcher)
        throw std::runtime_error("PxDefaultCpuDispatcherCreate failed");

    // Scene
    PxSceneDesc sceneDesc(m_physics->getTolerancesScale());
    sceneDesc.gravity = PxVec3(0.0f, -9.81f, 0.0f);
    sceneDesc.cpuDispatcher = m_dispatcher;
    sceneDesc.filterShader = PxDefaultSimulationFilterShader;
    m_scene = m_physics->createScene(sceneDesc);
    if (!m_scene) throw std::runtime_error("PxPhysics::createScene failed");

    // Default material
    m_defaultMaterial = m_physics->createMaterial(0.6f, 0.6f, 0.0f);
    if (!m_defaultMaterial) throw std::runtime_error("PxPhysics::createMaterial failed");

    m_query->setScene(m_scene);

    spdlog::info("[PhysicsWorld] PhysX initialized (foundation/physics/scene, threads={})", threads);
}

void PhysicsWorld::stepSimulation(float deltaTime) {
    if (!m_scene) return;

    for (auto& body : m_bodies)
        body->capturePreviousPose();

    // Simulate and fetch results synchronously
    m_scene->simulate(deltaTime);
    m_scene->fetchResults(true);
}

PxRigidStatic* PhysicsWorld::createGroundPlane(float height) {
    if (!m_physics || !m_scene) {
        spdlog::error("[PhysicsWorld] createGroundPlane called before initPhysx");
        return nullptr;
    }

    PxPlane plane(PxVec3(0, 1, 0), -height);
    PxRigidStatic* ground = PxCreatePlane(*m_physics, plane, *m_defaultMaterial);
    if (!ground) {
        spdlog::error("[PhysicsWorld] PxCreatePlane failed");
        return nullptr;
    }
    m_scene->addActor(*ground);
    spdlog::info("[PhysicsWorld] Ground plane at y={:.2f}", height);
    return ground;
}

PxRigidStatic* PhysicsWorld::createStaticBox(
    const glm::vec3& position,
    const glm::quat& rotation,
    const glm::vec3& halfExtents)
{
    if (!m_physics || !m_scene) {
        spdlog::error("[PhysicsWorld] createStaticBox called before initPhysx");
        return nullptr;
    }

    PxRigidStatic* actor = PxCreateStatic(
        *m_physics,
        glmToPxTransform(position, rotation),
        PxBoxGeometry(glmToPx(halfExtents)),
        *m_defaultMaterial);
    if (!actor) {
        spdlog::error("[PhysicsWorld] PxCreateStatic failed for box ({:.2f}, {:.2f}, {:.2f})",
            halfExtents.x, halfExtents.y, halfExtents.z);
        return nullptr;
    }

    m_scene->addActor(*actor);
    return actor;
}

std::shared_ptr<PxRigidBodyAdapter> PhysicsWorld::createDynamicBody(const DynamicBodyDesc& desc) {
    if (!m_physics || !m_scene)
        throw std::runtime_error("PhysicsWorld::createDynamicBody called before initPhysx");

    PxRigidDynamic* actor = m_physics->createRigidDynamic(glmToPxTransform(desc.position, desc.rotation));
    if (!actor)
        throw std::runtime_error("createRigidDynamic failed");

    for (const auto& part : desc.parts) {
        PxShape* shape = PxRigidActorExt::createExclusiveShape(
            *actor, PxBoxGeometry(glmToPx(part.halfExtents)), *m_defaultMaterial);
        if (!shape) {
            actor->release();
            throw std::runtime_error("createExclusiveShape failed for vehicle part");
        }
        shape->setLocalPose(PxTransform(glmToPx(part.center)));
    }

    if (!desc.parts.empty() && desc.mass > 0.f)
        PxRigidBodyExt::setMassAndUpdateInertia(*actor, desc.mass);

    m_scene->addActor(*actor);

    auto body = std::make_shared<PxRigidBodyAdapter>(actor);
    m_bodies.push_back(body);

    spdlog::info("[PhysicsWorld] Dynamic body created at ({:.2f}, {:.2f}, {:.2f}), parts={}, mass={:.1f}",
        desc.position.x, desc.position.y, desc.position.z, desc.parts.size(), desc.mass);
    return body;
}

void PhysicsWorld::destroyBody(const std::shared_ptr<PxRigidBodyAdapter>& body) {
    if (!body || !body->isValid()) return;

    PxRigidDynamic* actor = body->getActor();
    if (m_scene) m_scene->removeActor(*actor);
    actor->release();
    body->invalidate();

    m_bodies.erase(std::remove(m_bodies.begin(), m_bodies.end(), body), m_bodies.end());
}

PhysicsWorld::~PhysicsWorld() {
    for (auto& body : m_bodies)
        body->invalidate();
    m_bodies.clear();

    if (m_scene) {
        // release() also releases every actor still in the scene
        m_scene->release();
        m_scene = nullptr;
    }
    if (m_dispatcher) {
        m_dispatcher->release();
        m_dispatcher = nullptr;
    }
    if (m_physics) {
        m_physics->release();
        m_physics = nullptr;
    }
    if (m_foundation) {
        m_foundation->release();
        m_foundation = nullptr;
    }
}
