#include "common/drive_pch.h"
#include "input/vehicle_input.h"
#include "common/drive_math.h"

namespace Drive {

    namespace {
        float sanitizeAxis(float v) {
            if (!std::isfinite(v)) return 0.f;
            return glm::clamp(v, -1.f, 1.f);
        }

        // std::visit helper
        template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
        template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
    }

    DriveCommand normalizeInput(const VehicleInputSignal& signal)
    {
        return std::visit(Overloaded{
            [](const KeyboardInput& k) {
                return DriveCommand{ sanitizeAxis(k.throttle), sanitizeAxis(k.steering) };
            },
            [](const DragInput& d) {
                const glm::vec2 v{ sanitizeAxis(d.dragVector.x), sanitizeAxis(d.dragVector.y) };
                return DriveCommand{ clamp01(glm::length(v)), v.x };
            }
        }, signal);
    }

    InputAxis::InputAxis(float sensitivity, float gravity, bool snap)
        : m_sensitivity(sensitivity)
        , m_gravity(gravity)
        , m_snap(snap)
    {
    }

    float InputAxis::update(bool negative, bool positive, float dt)
    {
        if (!std::isfinite(dt) || dt <= 0.f) return m_value;

        const float target = (positive ? 1.f : 0.f) - (negative ? 1.f : 0.f);

        if (target == 0.f) {
            const float step = m_gravity * dt;
            if (std::abs(m_value) <= step) m_value = 0.f;
            else m_value -= std::copysign(step, m_value);
            return m_value;
        }

        if (m_snap && m_value != 0.f && std::signbit(m_value) != std::signbit(target))
            m_value = 0.f;

        m_value = glm::clamp(m_value + target * m_sensitivity * dt, -1.f, 1.f);
        return m_value;
    }

    glm::vec2 joystickVectorFromDrag(const glm::vec2& pressPoint, const glm::vec2& cursor, float handleRange)
    {
        if (handleRange <= 0.f || !isFinite(pressPoint) || !isFinite(cursor))
            return glm::vec2(0.f);

        glm::vec2 offset = cursor - pressPoint;
        offset.y = -offset.y;
        return clampMagnitude(offset, handleRange) / handleRange;
    }

    glm::vec2 DragSmoother::update(const glm::vec2& raw, float dt)
    {
        const glm::vec2 target = isFinite(raw) ? raw : glm::vec2(0.f);
        if (!std::isfinite(dt) || dt <= 0.f) return m_value;

        m_value = glm::mix(m_value, target, clamp01(m_rate * dt));
        return m_value;
    }

    void InputRouter::setSource(std::shared_ptr<IVehicleInput> source)
    {
        if (source)
            spdlog::info("[InputRouter] Input source set to '{}'", source->getName());
        else if (m_source)
            spdlog::info("[InputRouter] Input source '{}' cleared", m_source->getName());

        m_source = std::move(source);
    }

    DriveCommand InputRouter::poll(float dt)
    {
        if (!m_source) return DriveCommand{};
        return normalizeInput(m_source->poll(dt));
    }

}
