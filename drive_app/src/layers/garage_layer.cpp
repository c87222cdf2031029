// garage_layer.cpp
#include "common/app_pch.h"
#include "layers/garage_layer.h"
#include "input/keyboard_vehicle_input.h"
#include "input/drag_vehicle_input.h"
#include "drive_app.h"
#include <glm/gtc/quaternion.hpp>


namespace {

    std::string resourcePath(const std::string& folder, const std::string& name) {
        return std::string(DRIVE_ROOT_DIR) + "/drive_app/res/" + folder + "/" + name + ".json";
    }

    constexpr float TITLE_REFRESH_SECONDS = 0.25f;
}

GarageLayer::GarageLayer(std::string garageName)
    : m_garageName(std::move(garageName))
{
}

void GarageLayer::onAttach(Drive::DriveApp* app) {
    m_isAttached = true;
    m_app = app;
}

void GarageLayer::onInit()
{
    m_window = &m_app->getWindow();
    m_world = &m_app->getPhysicsWorld();
    spdlog::info("GarageLayer::onInit");

    m_config = loadGarageConfig(resourcePath("scenes", m_garageName));
    spdlog::set_level(spdlog::level::from_str(m_config.logLevel));

    const Drive::DriveTuning tuning = Drive::loadDriveTuning(resourcePath("config", m_config.tuningFile));
    m_rig = std::make_unique<Drive::VehicleRig>(tuning, &m_world->getQuery());

    const InputSettings& in = m_config.input;
    m_keyboardInput = std::make_shared<KeyboardVehicleInput>(
        *m_window, in.axisSensitivity, in.axisGravity, in.axisSnap);
    m_dragInput = std::make_shared<DragVehicleInput>(
        *m_window, in.dragHandleRange, in.dragSmoothing);

    m_rig->setInputSource(in.defaultSource == "drag" ? m_dragInput : m_keyboardInput);

    buildStaticScene();
    spawnVehicle(0);
}

void GarageLayer::buildStaticScene()
{
    m_world->createGroundPlane(m_config.groundHeight);

    for (const auto& ramp : m_config.ramps) {
        const glm::quat rotation(glm::radians(ramp.rotation));
        m_world->createStaticBox(ramp.position, rotation, ramp.halfExtents);
    }
    spdlog::info("[Garage] Static scene built ({} ramps)", m_config.ramps.size());
}

void GarageLayer::spawnVehicle(size_t presetIndex)
{
    if (presetIndex >= m_config.presets.size()) {
        spdlog::warn("[Garage] No vehicle preset {} ({} available)", presetIndex + 1, m_config.presets.size());
        return;
    }

    if (m_body) {
        m_rig->unbind();
        m_world->destroyBody(m_body);
        m_body.reset();
        m_geometry.reset();
    }

    const VehiclePreset& preset = m_config.presets[presetIndex];

    DynamicBodyDesc desc;
    desc.parts = preset.parts;
    desc.mass = preset.mass;
    desc.position = m_config.spawnPosition;
    desc.rotation = glm::angleAxis(glm::radians(m_config.spawnYaw), glm::vec3(0.f, 1.f, 0.f));

    try {
        m_body = m_world->createDynamicBody(desc);
    }
    catch (const std::exception& e) {
        spdlog::error("[Garage] Could not spawn '{}': {}", preset.name, e.what());
        return;
    }
    m_geometry = std::make_unique<PxGeometrySource>(m_body);

    const Drive::BindStatus status = m_rig->bind(m_body, m_geometry.get());
    if (status != Drive::BindStatus::Ok) {
        spdlog::error("[Garage] Vehicle '{}' not driveable: {}", preset.name, Drive::toString(status));
        return;
    }

    m_activePreset = presetIndex;
    m_lastReport.reset();
    spdlog::info("[Garage] Driving '{}'", preset.name);
}

void GarageLayer::toggleInputSource()
{
    const bool usingKeyboard = m_rig->getInputRouter().getSource() == m_keyboardInput.get();
    m_rig->setInputSource(usingKeyboard ? m_dragInput : m_keyboardInput);
}

void GarageLayer::onFixedUpdate(float fixedDt)
{
    if (!m_rig) return;
    if (auto report = m_rig->fixedUpdate(fixedDt))
        m_lastReport = report;
}

void GarageLayer::onUpdate(float dt)
{
    m_titleTimer += dt;
    if (m_titleTimer < TITLE_REFRESH_SECONDS) return;
    m_titleTimer = 0.f;
    updateTitle();
}

void GarageLayer::onKeyEvent(DriveKey key, KeyAction action)
{
    if (action != KeyAction::PRESS || !m_rig) return;

    switch (key) {
    case DriveKey::NUM_1: spawnVehicle(0); break;
    case DriveKey::NUM_2: spawnVehicle(1); break;
    case DriveKey::NUM_3: spawnVehicle(2); break;
    case DriveKey::TAB:   toggleInputSource(); break;
    default: break;
    }
}

void GarageLayer::updateTitle()
{
    if (!m_window) return;

    std::string title = m_app->getSpecification().name;
    if (m_body && m_body->isValid() && m_rig->isBound()) {
        const Drive::VehicleState& state = m_rig->getLastState();
        const glm::vec3 position = m_body->getInterpolatedPosition(m_app->getInterpolationAlpha());
        IVehicleInput* source = m_rig->getInputRouter().getSource();

        title += fmt::format(" | {} | {} | {:.1f} m/s | y={:.2f} | {}",
            m_config.presets[m_activePreset].name,
            m_lastReport ? Drive::toString(m_lastReport->regime) : "-",
            state.forwardSpeed,
            position.y,
            source ? source->getName() : "no input");
    }
    else {
        title += " | no vehicle";
    }
    m_window->setTitle(title);
}

void GarageLayer::onDetach()
{
    if (m_rig) m_rig->unbind();
    if (m_body) {
        m_world->destroyBody(m_body);
        m_body.reset();
    }
    m_isAttached = false;
}
