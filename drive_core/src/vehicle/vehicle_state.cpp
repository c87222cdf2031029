#include "common/drive_pch.h"
#include "vehicle/vehicle_state.h"
#include "sensing/ground_sensor.h"
#include "interfaces/rigid_body_i.h"
#include "common/drive_math.h"

namespace Drive {

    float computeGripFactor(bool isGrounded, float forwardSpeed, const DriveTuning& tuning)
    {
        if (!isGrounded) return tuning.airborneGrip;

        const float speed = std::isfinite(forwardSpeed) ? std::abs(forwardSpeed) : 0.f;
        const float speedNorm = clamp01(speed / tuning.maxSpeed);
        return glm::mix(tuning.gripMin, tuning.gripMax, speedNorm);
    }

    float computeControlAuthority(bool isGrounded, float gripFactor, const DriveTuning& tuning)
    {
        return isGrounded ? gripFactor : tuning.airborneAuthority;
    }

    VehicleState deriveVehicleState(
        const glm::vec3& bodyLocalVelocity,
        bool isGrounded,
        const glm::vec3& groundNormal,
        const DriveTuning& tuning)
    {
        const glm::vec3 local = finiteOr(bodyLocalVelocity, glm::vec3(0.f));

        VehicleState state;
        state.lateralSpeed = local.x;
        state.forwardSpeed = local.z;
        state.isGrounded = isGrounded;
        state.groundNormal = isGrounded ? finiteOr(groundNormal, WORLD_UP) : WORLD_UP;
        state.gripFactor = computeGripFactor(isGrounded, state.forwardSpeed, tuning);
        state.controlAuthority = computeControlAuthority(isGrounded, state.gripFactor, tuning);
        return state;
    }

    VehicleState refreshVehicleState(
        const IRigidBody& body,
        GroundSensor& sensor,
        const DriveTuning& tuning)
    {
        const glm::quat orientation = finiteOr(body.getOrientation());
        const glm::vec3 velocity = finiteOr(body.getLinearVelocity(), glm::vec3(0.f));
        const glm::vec3 localVelocity = glm::inverse(orientation) * velocity;

        // Lift the origin along body up so the ray never starts inside the ground
        const glm::vec3 bodyUp = orientation * WORLD_UP;
        const glm::vec3 origin = finiteOr(body.getWorldCenterOfMass(), body.getPosition())
            + bodyUp * tuning.groundRayLift;
        sensor.update(origin, -bodyUp, &body);

        return deriveVehicleState(localVelocity, sensor.isGrounded(), sensor.getGroundNormal(), tuning);
    }

}
