#include "gtest/gtest.h"

#include "control/drive_tuning.h"

#include <fstream>
#include <stdexcept>
#include <string>

using namespace Drive;
using json = nlohmann::json;

namespace {

std::string writeTempFile(const std::string& name, const std::string& content) {
    const std::string path = testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(DriveTuningTest, DefaultsAreValid) {
    DriveTuning tuning;
    EXPECT_TRUE(tuning.validate().empty());
}

TEST(DriveTuningTest, AirborneFactorsForcedBelowOne) {
    DriveTuning tuning;
    tuning.airborneDriveFactor = 1.5f;
    tuning.airborneSteeringResponse = 1.f;

    const auto issues = tuning.validate();
    EXPECT_EQ(issues.size(), 2u);
    EXPECT_LT(tuning.airborneDriveFactor, 1.f);
    EXPECT_LT(tuning.airborneSteeringResponse, 1.f);
}

TEST(DriveTuningTest, ClampsBrokenRanges) {
    DriveTuning tuning;
    tuning.maxSpeed = 0.f;
    tuning.gripMax = 0.1f;
    tuning.invertedThreshold = 3.f;
    tuning.uprightTorqueGain = -5.f;

    EXPECT_FALSE(tuning.validate().empty());
    EXPECT_GT(tuning.maxSpeed, 0.f);
    EXPECT_GE(tuning.gripMax, tuning.gripMin);
    EXPECT_LE(tuning.invertedThreshold, 1.f);
    EXPECT_GE(tuning.uprightTorqueGain, 0.f);
}

TEST(DriveTuningTest, MissingKeysKeepDefaults) {
    const json j = json::parse(R"({ "drive": { "max_speed": 22.0 }, "grip": { "airborne": 0.1 } })");
    const DriveTuning tuning = j.get<DriveTuning>();
    const DriveTuning defaults;

    EXPECT_FLOAT_EQ(tuning.maxSpeed, 22.f);
    EXPECT_FLOAT_EQ(tuning.airborneGrip, 0.1f);
    EXPECT_FLOAT_EQ(tuning.forwardSpeedFactor, defaults.forwardSpeedFactor);
    EXPECT_FLOAT_EQ(tuning.uprightTorqueGain, defaults.uprightTorqueGain);
    EXPECT_EQ(tuning.airborneUpright, defaults.airborneUpright);
}

TEST(DriveTuningTest, JsonKeepsEveryField) {
    DriveTuning tuning;
    tuning.turnSpeedFactor = 4.5f;
    tuning.airborneUpright = true;
    tuning.centerOfMassHeightBias = 0.3f;

    const json j = tuning;
    const DriveTuning back = j.get<DriveTuning>();
    EXPECT_FLOAT_EQ(back.turnSpeedFactor, 4.5f);
    EXPECT_TRUE(back.airborneUpright);
    EXPECT_FLOAT_EQ(back.centerOfMassHeightBias, 0.3f);
}

TEST(DriveTuningTest, LoadsAndValidatesFile) {
    const std::string path = writeTempFile("drive_tuning_load.json",
        R"({ "drive": { "airborne_drive_factor": 2.0, "max_speed": 18.0 } })");

    const DriveTuning tuning = loadDriveTuning(path);
    EXPECT_FLOAT_EQ(tuning.maxSpeed, 18.f);
    EXPECT_LT(tuning.airborneDriveFactor, 1.f);
}

TEST(DriveTuningTest, MissingFileThrows) {
    EXPECT_THROW(loadDriveTuning(testing::TempDir() + "no_such_tuning.json"), std::runtime_error);
}

TEST(DriveTuningTest, MalformedFileThrows) {
    const std::string path = writeTempFile("drive_tuning_broken.json", "{ \"drive\": ");
    EXPECT_THROW(loadDriveTuning(path), std::runtime_error);
}

TEST(DriveTuningTest, ShippedConfigMatchesDefaults) {
    const DriveTuning shipped = loadDriveTuning(
        std::string(DRIVE_ROOT_DIR) + "/drive_app/res/config/drive_tuning.json");
    const DriveTuning defaults;

    EXPECT_FLOAT_EQ(shipped.maxSpeed, defaults.maxSpeed);
    EXPECT_FLOAT_EQ(shipped.forwardSpeedFactor, defaults.forwardSpeedFactor);
    EXPECT_FLOAT_EQ(shipped.gripMin, defaults.gripMin);
    EXPECT_FLOAT_EQ(shipped.gripMax, defaults.gripMax);
    EXPECT_FLOAT_EQ(shipped.recoveryTorqueGain, defaults.recoveryTorqueGain);
}
