#include "common/app_pch.h"
#include "input/drag_vehicle_input.h"


DragVehicleInput::DragVehicleInput(IWindow& window, float handleRange, float smoothing)
    : m_window(window)
    , m_handleRange(handleRange)
    , m_smoother(smoothing)
{
}

VehicleInputSignal DragVehicleInput::poll(float dt) {
    glm::vec2 raw(0.f);

    if (m_window.isMouseButtonPressed(DriveMouseButton::LEFT)) {
        const glm::vec2 cursor = m_window.getCursorPosition();
        if (!m_dragging) {
            m_dragging = true;
            m_pressPoint = cursor;
        }
        raw = Drive::joystickVectorFromDrag(m_pressPoint, cursor, m_handleRange);
    }
    else {
        m_dragging = false;
    }

    DragInput input;
    input.dragVector = m_smoother.update(raw, dt);
    return input;
}
