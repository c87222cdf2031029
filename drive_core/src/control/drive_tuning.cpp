#include "common/drive_pch.h"
#include "control/drive_tuning.h"

using json = nlohmann::json;

namespace Drive {

    namespace {
        void clampAtLeast(float& value, float minimum, const char* name, std::vector<std::string>& issues) {
            if (!std::isfinite(value) || value < minimum) {
                issues.push_back(fmt::format("{} = {} raised to {}", name, value, minimum));
                value = minimum;
            }
        }

        void clampBelowOne(float& value, const char* name, std::vector<std::string>& issues) {
            constexpr float ceiling = 0.99f;
            if (!std::isfinite(value) || value >= 1.f) {
                issues.push_back(fmt::format("{} = {} must stay below 1, set to {}", name, value, ceiling));
                value = ceiling;
            }
            clampAtLeast(value, 0.f, name, issues);
        }
    }

    std::vector<std::string> DriveTuning::validate()
    {
        std::vector<std::string> issues;

        clampAtLeast(forwardSpeedFactor, 0.f, "forward_speed_factor", issues);
        clampAtLeast(maxSpeed, 0.1f, "max_speed", issues);
        clampBelowOne(airborneDriveFactor, "airborne_drive_factor", issues);

        clampAtLeast(turnSpeedFactor, 0.f, "turn_speed_factor", issues);
        clampAtLeast(maxYawSpeed, 0.f, "max_yaw_speed", issues);
        clampAtLeast(steeringResponse, 0.f, "steering_response", issues);
        clampBelowOne(airborneSteeringResponse, "airborne_steering_response", issues);

        clampAtLeast(airborneGrip, 0.f, "airborne_grip", issues);
        clampAtLeast(gripMin, airborneGrip, "grip_min", issues);
        clampAtLeast(gripMax, gripMin, "grip_max", issues);
        clampAtLeast(airborneAuthority, 0.f, "airborne_authority", issues);
        clampAtLeast(gripStrength, 0.f, "grip_strength", issues);

        clampAtLeast(baseDownforce, 0.f, "base_downforce", issues);
        clampAtLeast(downforceSpeedMultiplier, 0.f, "downforce_speed_multiplier", issues);

        clampAtLeast(uprightTorqueGain, 0.f, "upright_torque_gain", issues);
        clampAtLeast(uprightAngularDamping, 0.f, "upright_angular_damping", issues);
        if (!std::isfinite(invertedThreshold) || invertedThreshold < -1.f || invertedThreshold > 1.f) {
            issues.push_back(fmt::format("inverted_threshold = {} outside [-1, 1], reset to 0.2", invertedThreshold));
            invertedThreshold = 0.2f;
        }
        clampAtLeast(recoveryTorqueGain, 0.f, "recovery_torque_gain", issues);
        clampAtLeast(airborneAngularCap, 0.f, "airborne_angular_cap", issues);

        clampAtLeast(groundRayMargin, 0.f, "ground_ray_margin", issues);
        clampAtLeast(minGroundRayLength, 0.01f, "min_ground_ray_length", issues);
        clampAtLeast(groundRayLift, 0.f, "ground_ray_lift", issues);
        clampAtLeast(centerOfMassHeightBias, 0.f, "center_of_mass_height_bias", issues);

        clampAtLeast(bodyAngularDamping, 0.f, "body_angular_damping", issues);
        clampAtLeast(bodyLinearDamping, 0.f, "body_linear_damping", issues);

        return issues;
    }

    void from_json(const json& j, DriveTuning& t)
    {
        const DriveTuning d{};

        if (j.contains("drive")) {
            const auto& s = j["drive"];
            t.forwardSpeedFactor = s.value("forward_speed_factor", d.forwardSpeedFactor);
            t.maxSpeed = s.value("max_speed", d.maxSpeed);
            t.airborneDriveFactor = s.value("airborne_drive_factor", d.airborneDriveFactor);
        }

        if (j.contains("steering")) {
            const auto& s = j["steering"];
            t.turnSpeedFactor = s.value("turn_speed_factor", d.turnSpeedFactor);
            t.maxYawSpeed = s.value("max_yaw_speed", d.maxYawSpeed);
            t.steeringResponse = s.value("response", d.steeringResponse);
            t.airborneSteeringResponse = s.value("airborne_response", d.airborneSteeringResponse);
        }

        if (j.contains("grip")) {
            const auto& s = j["grip"];
            t.gripMin = s.value("min", d.gripMin);
            t.gripMax = s.value("max", d.gripMax);
            t.airborneGrip = s.value("airborne", d.airborneGrip);
            t.airborneAuthority = s.value("airborne_authority", d.airborneAuthority);
            t.gripStrength = s.value("lateral_strength", d.gripStrength);
        }

        if (j.contains("downforce")) {
            const auto& s = j["downforce"];
            t.baseDownforce = s.value("base", d.baseDownforce);
            t.downforceSpeedMultiplier = s.value("speed_multiplier", d.downforceSpeedMultiplier);
        }

        if (j.contains("stability")) {
            const auto& s = j["stability"];
            t.uprightTorqueGain = s.value("upright_torque", d.uprightTorqueGain);
            t.uprightAngularDamping = s.value("angular_damping", d.uprightAngularDamping);
            t.airborneUpright = s.value("airborne_upright", d.airborneUpright);
            t.invertedThreshold = s.value("inverted_threshold", d.invertedThreshold);
            t.recoveryTorqueGain = s.value("recovery_torque", d.recoveryTorqueGain);
            t.airborneAngularCap = s.value("airborne_angular_cap", d.airborneAngularCap);
        }

        if (j.contains("body")) {
            const auto& s = j["body"];
            t.groundRayMargin = s.value("ground_ray_margin", d.groundRayMargin);
            t.minGroundRayLength = s.value("min_ground_ray_length", d.minGroundRayLength);
            t.groundRayLift = s.value("ground_ray_lift", d.groundRayLift);
            t.centerOfMassHeightBias = s.value("center_of_mass_height_bias", d.centerOfMassHeightBias);
            t.bodyAngularDamping = s.value("angular_damping", d.bodyAngularDamping);
            t.bodyLinearDamping = s.value("linear_damping", d.bodyLinearDamping);
        }
    }

    void to_json(json& j, const DriveTuning& t)
    {
        j = json{
            { "drive", {
                { "forward_speed_factor", t.forwardSpeedFactor },
                { "max_speed", t.maxSpeed },
                { "airborne_drive_factor", t.airborneDriveFactor } } },
            { "steering", {
                { "turn_speed_factor", t.turnSpeedFactor },
                { "max_yaw_speed", t.maxYawSpeed },
                { "response", t.steeringResponse },
                { "airborne_response", t.airborneSteeringResponse } } },
            { "grip", {
                { "min", t.gripMin },
                { "max", t.gripMax },
                { "airborne", t.airborneGrip },
                { "airborne_authority", t.airborneAuthority },
                { "lateral_strength", t.gripStrength } } },
            { "downforce", {
                { "base", t.baseDownforce },
                { "speed_multiplier", t.downforceSpeedMultiplier } } },
            { "stability", {
                { "upright_torque", t.uprightTorqueGain },
                { "angular_damping", t.uprightAngularDamping },
                { "airborne_upright", t.airborneUpright },
                { "inverted_threshold", t.invertedThreshold },
                { "recovery_torque", t.recoveryTorqueGain },
                { "airborne_angular_cap", t.airborneAngularCap } } },
            { "body", {
                { "ground_ray_margin", t.groundRayMargin },
                { "min_ground_ray_length", t.minGroundRayLength },
                { "ground_ray_lift", t.groundRayLift },
                { "center_of_mass_height_bias", t.centerOfMassHeightBias },
                { "angular_damping", t.bodyAngularDamping },
                { "linear_damping", t.bodyLinearDamping } } }
        };
    }

    DriveTuning loadDriveTuning(const std::string& path)
    {
        std::ifstream inFile(path);
        if (!inFile.is_open())
            throw std::runtime_error("Could not open tuning file: " + path);

        json tuningJson;
        try {
            inFile >> tuningJson;
        }
        catch (const json::parse_error& e) {
            throw std::runtime_error("Could not parse tuning file '" + path + "': " + e.what());
        }

        DriveTuning tuning = tuningJson.get<DriveTuning>();
        for (const auto& issue : tuning.validate()) {
            spdlog::warn("[DriveTuning] {}", issue);
        }

        spdlog::info("[DriveTuning] Loaded '{}' (max_speed={:.1f}, forward_speed_factor={:.1f})",
            path, tuning.maxSpeed, tuning.forwardSpeedFactor);
        return tuning;
    }

}
