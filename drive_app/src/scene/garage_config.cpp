#include "common/app_pch.h"
#include "scene/garage_config.h"


using json = nlohmann::json;

namespace {

    glm::vec3 readVec3(const json& j, const char* key, const glm::vec3& fallback) {
        auto v = j.value(key, std::vector<float>{ fallback.x, fallback.y, fallback.z });
        if (v.size() != 3) {
            spdlog::warn("[Garage] '{}' needs 3 components, got {}", key, v.size());
            return fallback;
        }
        return { v[0], v[1], v[2] };
    }

}

GarageConfig loadGarageConfig(const std::string& path)
{
    std::ifstream inFile(path);
    if (!inFile.is_open())
        throw std::runtime_error("Could not open garage file: " + path);

    json garageJson;
    try {
        inFile >> garageJson;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Could not parse garage file '" + path + "': " + e.what());
    }

    GarageConfig config;
    config.tuningFile = garageJson.value("tuning", config.tuningFile);
    config.logLevel = garageJson.value("log_level", config.logLevel);

    if (garageJson.contains("ground")) {
        config.groundHeight = garageJson["ground"].value("height", 0.f);
    }

    if (garageJson.contains("ramps")) {
        for (const auto& rampJson : garageJson["ramps"]) {
            RampDesc ramp;
            ramp.position = readVec3(rampJson, "position", ramp.position);
            ramp.rotation = readVec3(rampJson, "rotation", ramp.rotation);
            ramp.halfExtents = readVec3(rampJson, "half_extents", ramp.halfExtents);
            config.ramps.push_back(ramp);
        }
    }

    if (garageJson.contains("spawn")) {
        const auto& j = garageJson["spawn"];
        config.spawnPosition = readVec3(j, "position", config.spawnPosition);
        config.spawnYaw = j.value("yaw", 0.f);
    }

    if (garageJson.contains("vehicles")) {
        for (const auto& vehicleJson : garageJson["vehicles"]) {
            VehiclePreset preset;
            preset.name = vehicleJson.value("name", std::string("vehicle"));
            preset.mass = vehicleJson.value("mass", preset.mass);

            if (vehicleJson.contains("boxes")) {
                for (const auto& boxJson : vehicleJson["boxes"]) {
                    BoxPart part;
                    part.center = readVec3(boxJson, "center", part.center);
                    part.halfExtents = readVec3(boxJson, "half_extents", part.halfExtents);
                    preset.parts.push_back(part);
                }
            }

            if (preset.parts.empty()) {
                spdlog::warn("[Garage] Vehicle '{}' has no boxes, skipped", preset.name);
                continue;
            }
            config.presets.push_back(std::move(preset));
        }
    }

    if (garageJson.contains("input")) {
        const auto& j = garageJson["input"];
        config.input.axisSensitivity = j.value("axis_sensitivity", config.input.axisSensitivity);
        config.input.axisGravity = j.value("axis_gravity", config.input.axisGravity);
        config.input.axisSnap = j.value("axis_snap", config.input.axisSnap);
        config.input.dragHandleRange = j.value("drag_handle_range", config.input.dragHandleRange);
        config.input.dragSmoothing = j.value("drag_smoothing", config.input.dragSmoothing);
        config.input.defaultSource = j.value("default_source", config.input.defaultSource);
    }

    spdlog::info("[Garage] Loaded '{}' ({} ramps, {} vehicles)", path, config.ramps.size(), config.presets.size());
    return config;
}
