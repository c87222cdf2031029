#pragma once
#include <glm/glm.hpp>
#include <string>
#include <variant>

// Throttle and steering, each in [-1, 1]
struct KeyboardInput {
    float throttle = 0.f;
    float steering = 0.f;
};

// Joystick style drag, each axis in [-1, 1]
struct DragInput {
    glm::vec2 dragVector{ 0.f };
};

using VehicleInputSignal = std::variant<KeyboardInput, DragInput>;

struct IVehicleInput {
    virtual ~IVehicleInput() = default;

    // Called once per fixed tick
    virtual VehicleInputSignal poll(float dt) = 0;
    virtual std::string getName() const = 0;
};
