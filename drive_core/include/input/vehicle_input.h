#pragma once
#include "interfaces/vehicle_input_i.h"
#include <glm/glm.hpp>
#include <memory>

namespace Drive {

    // The only input shape the force pipeline sees
    struct DriveCommand {
        float throttle = 0.f;   // [-1, 1]
        float steering = 0.f;   // [-1, 1]
    };

    // Keyboard passes through clamped; a drag vector maps to
    // throttle = clamp01(|drag|), steering = drag.x. Non-finite values read as 0.
    DriveCommand normalizeInput(const VehicleInputSignal& signal);

    // Digital key pair to a smoothed axis: ramps toward the target at sensitivity
    // units/s, returns to zero at gravity units/s, snaps to zero on reversal.
    class InputAxis {
    public:
        InputAxis(float sensitivity = 3.f, float gravity = 3.f, bool snap = true);

        float update(bool negative, bool positive, float dt);
        float getValue() const { return m_value; }
        void reset() { m_value = 0.f; }

    private:
        float m_sensitivity;
        float m_gravity;
        bool  m_snap;
        float m_value = 0.f;
    };

    // Converts a pointer drag into a joystick vector: displacement from the press
    // point clamped to handleRange pixels, screen Y flipped so up drives forward.
    glm::vec2 joystickVectorFromDrag(const glm::vec2& pressPoint, const glm::vec2& cursor, float handleRange);

    // Exponential follow of the raw drag vector, lerp(prev, raw, rate * dt)
    class DragSmoother {
    public:
        explicit DragSmoother(float rate = 80.f) : m_rate(rate) {}

        glm::vec2 update(const glm::vec2& raw, float dt);
        glm::vec2 getValue() const { return m_value; }
        void reset() { m_value = glm::vec2(0.f); }

    private:
        float     m_rate;
        glm::vec2 m_value{ 0.f };
    };

    // Holds whichever input source is active. Swapping sources never leaves a
    // half-read source; no source yields a zero command.
    class InputRouter {
    public:
        void setSource(std::shared_ptr<IVehicleInput> source);
        void clearSource() { setSource(nullptr); }

        bool hasSource() const { return m_source != nullptr; }
        IVehicleInput* getSource() const { return m_source.get(); }

        DriveCommand poll(float dt);

    private:
        std::shared_ptr<IVehicleInput> m_source;
    };

}
