#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Drive {

    // Every gain the drive layer uses. Defaults are shape-agnostic; no field is per-vehicle.
    struct DriveTuning {
        // Drive
        float forwardSpeedFactor = 20.f;     // m/s^2 at full throttle
        float maxSpeed = 15.f;               // horizontal cap, also grip normalization
        float airborneDriveFactor = 0.15f;   // must stay below 1

        // Steering (target yaw rate)
        float turnSpeedFactor = 3.f;         // rad/s at full steering and authority
        float maxYawSpeed = 2.5f;
        float steeringResponse = 6.f;
        float airborneSteeringResponse = 0.25f;

        // Grip
        float gripMin = 0.6f;
        float gripMax = 1.2f;
        float airborneGrip = 0.2f;
        float airborneAuthority = 0.2f;
        float gripStrength = 8.f;

        // Downforce
        float baseDownforce = 0.f;
        float downforceSpeedMultiplier = 0.5f;

        // Upright / recovery
        float uprightTorqueGain = 40.f;
        float uprightAngularDamping = 4.f;
        bool  airborneUpright = false;
        float invertedThreshold = 0.2f;
        float recoveryTorqueGain = 25.f;
        float airborneAngularCap = 2.5f;

        // Ground sensing and mass
        float groundRayMargin = 0.1f;
        float minGroundRayLength = 0.5f;
        float groundRayLift = 0.1f;
        float centerOfMassHeightBias = 0.55f;

        // Applied to the body on bind
        float bodyAngularDamping = 1.f;
        float bodyLinearDamping = 0.f;

        // Clamps every value that would break a runtime invariant. Returns one line per correction.
        std::vector<std::string> validate();
    };

    void from_json(const nlohmann::json& j, DriveTuning& tuning);
    void to_json(nlohmann::json& j, const DriveTuning& tuning);

    // Throws std::runtime_error when the file cannot be opened or parsed
    DriveTuning loadDriveTuning(const std::string& path);

}
