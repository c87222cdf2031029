#pragma once
#include "physics/physics_world.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>

struct VehiclePreset {
    std::string name;
    float mass = 1000.f;
    std::vector<BoxPart> parts;
};

struct RampDesc {
    glm::vec3 position{ 0.f };
    glm::vec3 rotation{ 0.f };      // degrees
    glm::vec3 halfExtents{ 1.f };
};

struct InputSettings {
    float axisSensitivity = 3.f;
    float axisGravity = 3.f;
    bool  axisSnap = true;
    float dragHandleRange = 150.f;
    float dragSmoothing = 80.f;
    std::string defaultSource = "keyboard";
};

struct GarageConfig {
    std::string tuningFile = "drive_tuning";
    std::string logLevel = "info";

    float groundHeight = 0.f;
    std::vector<RampDesc> ramps;

    glm::vec3 spawnPosition{ 0.f, 2.f, 0.f };
    float spawnYaw = 0.f;           // degrees
    std::vector<VehiclePreset> presets;

    InputSettings input;
};

// Throws std::runtime_error when the file cannot be opened or parsed
GarageConfig loadGarageConfig(const std::string& path);
