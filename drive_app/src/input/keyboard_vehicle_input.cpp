#include "common/app_pch.h"
#include "input/keyboard_vehicle_input.h"


KeyboardVehicleInput::KeyboardVehicleInput(IWindow& window, float sensitivity, float gravity, bool snap)
    : m_window(window)
    , m_throttle(sensitivity, gravity, snap)
    , m_steering(sensitivity, gravity, snap)
{
}

VehicleInputSignal KeyboardVehicleInput::poll(float dt) {
    const bool forward = m_window.isKeyPressed(DriveKey::W) || m_window.isKeyPressed(DriveKey::UP);
    const bool back = m_window.isKeyPressed(DriveKey::S) || m_window.isKeyPressed(DriveKey::DOWN);
    const bool right = m_window.isKeyPressed(DriveKey::D) || m_window.isKeyPressed(DriveKey::RIGHT);
    const bool left = m_window.isKeyPressed(DriveKey::A) || m_window.isKeyPressed(DriveKey::LEFT);

    KeyboardInput input;
    input.throttle = m_throttle.update(back, forward, dt);
    input.steering = m_steering.update(left, right, dt);
    return input;
}
