#pragma once
#include "interfaces/vehicle_input_i.h"
#include "interfaces/window_i.h"
#include "input/vehicle_input.h"

// W/S or Up/Down drive, A/D or Left/Right steer
class KeyboardVehicleInput final : public IVehicleInput {
public:
    KeyboardVehicleInput(IWindow& window, float sensitivity, float gravity, bool snap);

    VehicleInputSignal poll(float dt) override;
    std::string getName() const override { return "keyboard"; }

private:
    IWindow& m_window;
    Drive::InputAxis m_throttle;
    Drive::InputAxis m_steering;
};
