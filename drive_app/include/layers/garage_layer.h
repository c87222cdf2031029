#pragma once
#include "interfaces/layer_i.h"
#include "interfaces/window_i.h"
#include "vehicle/vehicle_rig.h"
#include "physics/physics_world.h"
#include "physics/px_geometry_source.h"
#include "scene/garage_config.h"
#include <memory>
#include <optional>
#include <string>

// Ground, ramps and a swappable vehicle driven by a VehicleRig.
// 1/2/3 pick a vehicle, Tab switches keyboard and drag input.
class GarageLayer : public ILayer {
public:
    explicit GarageLayer(std::string garageName = "garage");

    void onAttach(Drive::DriveApp* app) override;
    void onInit() override;
    void onFixedUpdate(float fixedDt) override;
    void onUpdate(float dt) override;
    void onKeyEvent(DriveKey key, KeyAction action) override;
    void onDetach() override;
    bool isAttached() override { return m_isAttached; }

    void spawnVehicle(size_t presetIndex);
    void toggleInputSource();

private:
    void buildStaticScene();
    void updateTitle();

    Drive::DriveApp* m_app = nullptr;
    IWindow*         m_window = nullptr;
    PhysicsWorld*    m_world = nullptr;

    std::string  m_garageName;
    GarageConfig m_config;

    std::unique_ptr<Drive::VehicleRig>  m_rig;
    std::shared_ptr<PxRigidBodyAdapter> m_body;
    std::unique_ptr<PxGeometrySource>   m_geometry;
    size_t m_activePreset = 0;

    std::shared_ptr<IVehicleInput> m_keyboardInput;
    std::shared_ptr<IVehicleInput> m_dragInput;

    std::optional<Drive::ShapingReport> m_lastReport;
    float m_titleTimer = 0.f;
    bool  m_isAttached = false;
};
