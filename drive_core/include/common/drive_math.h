#pragma once
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cmath>

namespace Drive {

    inline const glm::vec3 WORLD_UP{ 0.f, 1.f, 0.f };
    inline const glm::vec3 LOCAL_FORWARD{ 0.f, 0.f, 1.f };
    inline const glm::vec3 LOCAL_RIGHT{ 1.f, 0.f, 0.f };

    inline float clamp01(float v) { return glm::clamp(v, 0.f, 1.f); }

    inline bool isFinite(float v) { return std::isfinite(v); }
    inline bool isFinite(const glm::vec2& v) { return std::isfinite(v.x) && std::isfinite(v.y); }
    inline bool isFinite(const glm::vec3& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    // Non-finite readouts collapse to fallback so one bad sample cannot poison the step
    inline glm::vec3 finiteOr(const glm::vec3& v, const glm::vec3& fallback) {
        return isFinite(v) ? v : fallback;
    }

    inline glm::quat finiteOr(const glm::quat& q) {
        if (!std::isfinite(q.w) || !std::isfinite(q.x) || !std::isfinite(q.y) || !std::isfinite(q.z))
            return glm::quat(1.f, 0.f, 0.f, 0.f);
        return glm::normalize(q);
    }

    inline glm::vec3 clampMagnitude(const glm::vec3& v, float maxLength) {
        const float len = glm::length(v);
        if (len <= maxLength || len <= 0.f) return v;
        return v * (maxLength / len);
    }

    inline glm::vec2 clampMagnitude(const glm::vec2& v, float maxLength) {
        const float len = glm::length(v);
        if (len <= maxLength || len <= 0.f) return v;
        return v * (maxLength / len);
    }
}
