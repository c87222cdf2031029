#pragma once
#include "control/drive_tuning.h"
#include <glm/glm.hpp>

struct IRigidBody;

namespace Drive {

    class GroundSensor;

    // Snapshot derived fresh every fixed tick; nothing carries over between ticks.
    struct VehicleState {
        float forwardSpeed = 0.f;     // body-local +Z
        float lateralSpeed = 0.f;     // body-local +X
        bool isGrounded = false;
        glm::vec3 groundNormal{ 0.f, 1.f, 0.f };
        // Airborne values until the first tick
        float gripFactor = 0.2f;
        float controlAuthority = 0.2f;
    };

    // lerp(gripMin, gripMax, |forwardSpeed| / maxSpeed) while grounded, airborneGrip otherwise
    float computeGripFactor(bool isGrounded, float forwardSpeed, const DriveTuning& tuning);
    float computeControlAuthority(bool isGrounded, float gripFactor, const DriveTuning& tuning);

    // Builds the grounding dependent fields from an already updated sensor result
    VehicleState deriveVehicleState(
        const glm::vec3& bodyLocalVelocity,
        bool isGrounded,
        const glm::vec3& groundNormal,
        const DriveTuning& tuning);

    // Reads the body velocity, runs the ground sensor, then derives grip and authority
    VehicleState refreshVehicleState(
        const IRigidBody& body,
        GroundSensor& sensor,
        const DriveTuning& tuning);

}
