#include "gtest/gtest.h"

#include "drive_test_helper.h"
#include "vehicle/vehicle_rig.h"

#include <cmath>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

using namespace Drive;

namespace {

constexpr float kDt = 1.f / 60.f;

std::shared_ptr<FakeRigidBody> makeBody(const glm::vec3& position) {
    auto body = std::make_shared<FakeRigidBody>();
    body->position = position;
    return body;
}

FakeGeometrySource boxAt(const glm::vec3& center, const glm::vec3& halfExtents) {
    return FakeGeometrySource({ Aabb::fromCenterExtents(center, halfExtents) });
}

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1))
        ++count;
    return count;
}

// Routes the default logger into a string for the lifetime of the scope
class LogCapture {
public:
    LogCapture()
        : m_previous(spdlog::default_logger())
    {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(m_stream);
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_level(spdlog::level::info);
        spdlog::set_default_logger(logger);
    }
    ~LogCapture() { spdlog::set_default_logger(m_previous); }

    std::string text() const { return m_stream.str(); }

private:
    std::ostringstream m_stream;
    std::shared_ptr<spdlog::logger> m_previous;
};

} // namespace

TEST(VehicleRigTest, RejectsNullBody) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    EXPECT_EQ(rig.bind(nullptr, nullptr), BindStatus::NullBody);
    EXPECT_FALSE(rig.isBound());
}

TEST(VehicleRigTest, RejectsInvalidMassAndMissingCollider) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto massless = makeBody(glm::vec3(0.f));
    massless->mass = 0.f;
    EXPECT_EQ(rig.bind(massless, nullptr), BindStatus::InvalidMass);

    auto nanMass = makeBody(glm::vec3(0.f));
    nanMass->mass = std::nanf("");
    EXPECT_EQ(rig.bind(nanMass, nullptr), BindStatus::InvalidMass);

    auto ghost = makeBody(glm::vec3(0.f));
    ghost->collider = false;
    EXPECT_EQ(rig.bind(ghost, nullptr), BindStatus::MissingCollider);

    EXPECT_FALSE(rig.isBound());
}

TEST(VehicleRigTest, FailedBindKeepsPreviousBinding) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto car = makeBody(glm::vec3(0.f, 1.f, 0.f));
    const FakeGeometrySource carGeometry = boxAt(car->position, { 1.f, 1.f, 2.f });
    ASSERT_EQ(rig.bind(car, &carGeometry), BindStatus::Ok);
    const float rayBefore = rig.getGeometryProfile()->groundRayLength;

    auto ghost = makeBody(glm::vec3(0.f));
    ghost->collider = false;
    EXPECT_EQ(rig.bind(ghost, nullptr), BindStatus::MissingCollider);

    EXPECT_EQ(rig.getBody(), car);
    EXPECT_FLOAT_EQ(rig.getGeometryProfile()->groundRayLength, rayBefore);
    EXPECT_TRUE(rig.fixedUpdate(kDt).has_value());
}

TEST(VehicleRigTest, BindConfiguresBody) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto body = makeBody(glm::vec3(0.f, 1.5f, 0.f));
    const FakeGeometrySource geometry = boxAt(body->position, { 2.f, 1.5f, 2.5f });
    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);

    EXPECT_FLOAT_EQ(body->centerOfMassOffset.y, -1.5f * tuning.centerOfMassHeightBias);
    EXPECT_FLOAT_EQ(body->angularDamping, 1.f);
    EXPECT_EQ(body->interpolation, BodyInterpolation::Interpolate);
    EXPECT_FLOAT_EQ(rig.getGroundSensor().getRayLength(), 1.6f);
}

TEST(VehicleRigTest, UnbindRestoresCenterOfMass) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto body = makeBody(glm::vec3(0.f, 1.f, 0.f));
    body->centerOfMassOffset = glm::vec3(0.f, 0.2f, 0.1f);
    const FakeGeometrySource geometry = boxAt(body->position, { 1.f, 1.f, 1.f });

    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);
    EXPECT_NE(body->centerOfMassOffset, glm::vec3(0.f, 0.2f, 0.1f));

    // Binding the same body again must not forget the original offset
    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);

    rig.unbind();
    EXPECT_FALSE(rig.isBound());
    EXPECT_EQ(body->centerOfMassOffset, glm::vec3(0.f, 0.2f, 0.1f));
}

TEST(VehicleRigTest, RebindDerivesProfileFromNewBodyOnly) {
    DriveTuning tuning;
    FakePhysicsQuery query;

    auto house = makeBody(glm::vec3(0.f, 2.f, 0.f));
    const FakeGeometrySource houseGeometry = boxAt(house->position, { 2.f, 2.f, 2.5f });
    auto banana = makeBody(glm::vec3(5.f, 0.3f, 0.f));
    const FakeGeometrySource bananaGeometry = boxAt(banana->position, { 0.25f, 0.3f, 1.2f });

    VehicleRig fresh(tuning, &query);
    ASSERT_EQ(fresh.bind(banana, &bananaGeometry), BindStatus::Ok);
    const GeometryProfile expected = *fresh.getGeometryProfile();
    fresh.unbind();

    VehicleRig rig(tuning, &query);
    ASSERT_EQ(rig.bind(house, &houseGeometry), BindStatus::Ok);
    ASSERT_GT(rig.getGeometryProfile()->groundRayLength, expected.groundRayLength);

    ASSERT_EQ(rig.bind(banana, &bananaGeometry), BindStatus::Ok);
    const GeometryProfile* profile = rig.getGeometryProfile();
    ASSERT_NE(profile, nullptr);
    EXPECT_FLOAT_EQ(profile->groundRayLength, expected.groundRayLength);
    EXPECT_EQ(profile->centerOfMassOffset, expected.centerOfMassOffset);
    EXPECT_FLOAT_EQ(rig.getGroundSensor().getRayLength(), expected.groundRayLength);
    EXPECT_EQ(banana->centerOfMassOffset, expected.centerOfMassOffset);

    // The previous body gets its own offset back
    EXPECT_EQ(house->centerOfMassOffset, glm::vec3(0.f));
}

TEST(VehicleRigTest, MissingGeometryFallsBackToMinimumRay) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    FakeGeometrySource broken;
    broken.throwOnQuery = true;

    ASSERT_EQ(rig.bind(makeBody(glm::vec3(0.f)), &broken), BindStatus::Ok);
    EXPECT_FLOAT_EQ(rig.getGeometryProfile()->groundRayLength, tuning.minGroundRayLength);
    EXPECT_EQ(rig.getGeometryProfile()->centerOfMassOffset, glm::vec3(0.f));
}

TEST(VehicleRigTest, TickWithoutBodyIsSkipped) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    EXPECT_FALSE(rig.fixedUpdate(kDt).has_value());
    EXPECT_FALSE(rig.fixedUpdate(kDt).has_value());
    EXPECT_EQ(query.calls, 0);
}

TEST(VehicleRigTest, TickWithoutInputStillStabilizes) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto body = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    body->linearVelocity = glm::vec3(2.f, 0.f, 0.f);
    const FakeGeometrySource geometry = boxAt(body->position, { 1.f, 0.5f, 2.f });
    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);

    const auto report = rig.fixedUpdate(kDt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->driveForce, glm::vec3(0.f));
    EXPECT_EQ(report->steeringTorque, glm::vec3(0.f));
    EXPECT_TRUE(report->lateralGripApplied);
    EXPECT_LT(body->linearVelocity.x, 2.f);
}

TEST(VehicleRigTest, ThrowingInputReadsAsZero) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto body = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource geometry = boxAt(body->position, { 1.f, 0.5f, 2.f });
    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);

    auto input = std::make_shared<FakeVehicleInput>(KeyboardInput{ 1.f, 0.f });
    input->throwOnPoll = true;
    rig.setInputSource(input);

    std::optional<ShapingReport> report;
    EXPECT_NO_THROW(report = rig.fixedUpdate(kDt));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->driveForce, glm::vec3(0.f));
}

TEST(VehicleRigTest, ThrowingInputIsLoggedOncePerOutage) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto body = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource geometry = boxAt(body->position, { 1.f, 0.5f, 2.f });
    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);

    auto input = std::make_shared<FakeVehicleInput>(KeyboardInput{ 1.f, 0.f });
    input->throwOnPoll = true;
    rig.setInputSource(input);

    const std::string failure = "Input source 'fake' failed";
    LogCapture capture;
    for (int i = 0; i < 30; ++i)
        ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    EXPECT_EQ(input->polls, 30);
    EXPECT_EQ(countOccurrences(capture.text(), failure), 1u);

    // A good poll re-arms the report for the next outage
    input->throwOnPoll = false;
    ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    input->throwOnPoll = true;
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    EXPECT_EQ(countOccurrences(capture.text(), failure), 2u);
}

TEST(VehicleRigTest, MissingQueryDrivesAsAirborne) {
    DriveTuning tuning;
    VehicleRig rig(tuning, nullptr);

    auto body = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource geometry = boxAt(body->position, { 1.f, 0.5f, 2.f });
    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);
    rig.setInputSource(std::make_shared<FakeVehicleInput>(KeyboardInput{ 1.f, 0.f }));

    const auto report = rig.fixedUpdate(kDt);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->regime, ControlRegime::Airborne);
    EXPECT_NEAR(glm::length(report->driveForce), tuning.forwardSpeedFactor * tuning.airborneDriveFactor, 1e-4f);
}

TEST(VehicleRigTest, BindDuringTickLandsOnNextTick) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto first = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource firstGeometry = boxAt(first->position, { 1.f, 0.5f, 2.f });
    auto second = makeBody(glm::vec3(10.f, 1.f, 0.f));
    const FakeGeometrySource secondGeometry = boxAt(second->position, { 1.f, 1.f, 1.f });
    ASSERT_EQ(rig.bind(first, &firstGeometry), BindStatus::Ok);

    auto input = std::make_shared<FakeVehicleInput>(KeyboardInput{ 1.f, 0.f });
    bool requested = false;
    input->onPoll = [&] {
        if (requested) return;
        requested = true;
        EXPECT_EQ(rig.bind(second, &secondGeometry), BindStatus::Ok);
    };
    rig.setInputSource(input);

    ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    EXPECT_TRUE(requested);
    // The whole tick went to the first body
    EXPECT_EQ(rig.getBody(), first);
    EXPECT_FALSE(first->forces.empty());
    EXPECT_TRUE(second->forces.empty());

    ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    EXPECT_EQ(rig.getBody(), second);
    EXPECT_FALSE(second->forces.empty());
    EXPECT_EQ(first->centerOfMassOffset, glm::vec3(0.f));
    EXPECT_FLOAT_EQ(rig.getGroundSensor().getRayLength(), 1.1f);
}

TEST(VehicleRigTest, UnbindDuringTickLandsOnNextTick) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto body = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource geometry = boxAt(body->position, { 1.f, 0.5f, 2.f });
    ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);

    auto input = std::make_shared<FakeVehicleInput>();
    input->onPoll = [&] { rig.unbind(); };
    rig.setInputSource(input);

    EXPECT_TRUE(rig.fixedUpdate(kDt).has_value());
    EXPECT_TRUE(rig.isBound());
    EXPECT_FALSE(rig.fixedUpdate(kDt).has_value());
    EXPECT_FALSE(rig.isBound());
}

TEST(VehicleRigTest, LaterBindSupersedesDeferredBind) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto first = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource firstGeometry = boxAt(first->position, { 1.f, 0.5f, 2.f });
    auto staged = makeBody(glm::vec3(10.f, 1.f, 0.f));
    const FakeGeometrySource stagedGeometry = boxAt(staged->position, { 1.f, 1.f, 1.f });
    auto latest = makeBody(glm::vec3(-10.f, 0.5f, 0.f));
    const FakeGeometrySource latestGeometry = boxAt(latest->position, { 1.f, 0.5f, 1.5f });
    ASSERT_EQ(rig.bind(first, &firstGeometry), BindStatus::Ok);

    auto input = std::make_shared<FakeVehicleInput>(KeyboardInput{ 1.f, 0.f });
    bool requested = false;
    input->onPoll = [&] {
        if (requested) return;
        requested = true;
        EXPECT_EQ(rig.bind(staged, &stagedGeometry), BindStatus::Ok);
    };
    rig.setInputSource(input);

    ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    ASSERT_TRUE(requested);
    ASSERT_EQ(rig.getBody(), first);

    ASSERT_EQ(rig.bind(latest, &latestGeometry), BindStatus::Ok);
    EXPECT_EQ(rig.getBody(), latest);

    ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    EXPECT_EQ(rig.getBody(), latest);
    EXPECT_FALSE(latest->forces.empty());
    EXPECT_TRUE(staged->forces.empty());
    EXPECT_EQ(staged->centerOfMassOffset, glm::vec3(0.f));
}

TEST(VehicleRigTest, LaterBindSupersedesDeferredUnbind) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    auto first = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource firstGeometry = boxAt(first->position, { 1.f, 0.5f, 2.f });
    auto latest = makeBody(glm::vec3(-10.f, 0.5f, 0.f));
    const FakeGeometrySource latestGeometry = boxAt(latest->position, { 1.f, 0.5f, 1.5f });
    ASSERT_EQ(rig.bind(first, &firstGeometry), BindStatus::Ok);

    auto input = std::make_shared<FakeVehicleInput>(KeyboardInput{ 1.f, 0.f });
    bool requested = false;
    input->onPoll = [&] {
        if (requested) return;
        requested = true;
        rig.unbind();
    };
    rig.setInputSource(input);

    ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    ASSERT_TRUE(requested);
    ASSERT_TRUE(rig.isBound());

    ASSERT_EQ(rig.bind(latest, &latestGeometry), BindStatus::Ok);

    ASSERT_TRUE(rig.fixedUpdate(kDt).has_value());
    EXPECT_TRUE(rig.isBound());
    EXPECT_EQ(rig.getBody(), latest);
    EXPECT_FALSE(latest->forces.empty());
}

TEST(VehicleRigTest, LastStateBeforeFirstTickIsAirborne) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    VehicleRig rig(tuning, &query);

    EXPECT_FALSE(rig.getLastState().isGrounded);
    EXPECT_FLOAT_EQ(rig.getLastState().gripFactor, tuning.airborneGrip);
    EXPECT_FLOAT_EQ(rig.getLastState().controlAuthority, tuning.airborneAuthority);
}

TEST(VehicleRigTest, DestructionReleasesBody) {
    DriveTuning tuning;
    FakePhysicsQuery query;
    auto body = makeBody(glm::vec3(0.f, 0.5f, 0.f));
    const FakeGeometrySource geometry = boxAt(body->position, { 1.f, 0.5f, 2.f });

    {
        VehicleRig rig(tuning, &query);
        ASSERT_EQ(rig.bind(body, &geometry), BindStatus::Ok);
        ASSERT_NE(body->centerOfMassOffset, glm::vec3(0.f));
    }
    EXPECT_EQ(body->centerOfMassOffset, glm::vec3(0.f));
    EXPECT_EQ(body.use_count(), 1);
}
