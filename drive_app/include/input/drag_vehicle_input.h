#pragma once
#include "interfaces/vehicle_input_i.h"
#include "interfaces/window_i.h"
#include "input/vehicle_input.h"

// Floating joystick: the left mouse press point is the stick center
class DragVehicleInput final : public IVehicleInput {
public:
    DragVehicleInput(IWindow& window, float handleRange, float smoothing);

    VehicleInputSignal poll(float dt) override;
    std::string getName() const override { return "drag"; }

    bool isDragging() const { return m_dragging; }

private:
    IWindow& m_window;
    float m_handleRange;
    Drive::DragSmoother m_smoother;

    bool m_dragging = false;
    glm::vec2 m_pressPoint{ 0.f };
};
