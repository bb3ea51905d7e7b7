#include "feedback_controller.h"
#include "test_doubles.h"
#include <gtest/gtest.h>

using namespace seatsense;
using namespace seatsense_test;

namespace {

DetectionState stateOf(Occupancy occupancy, float confidence) {
    DetectionState s;
    s.classification = occupancy;
    s.rawClassification = occupancy;
    s.confidence = confidence;
    return s;
}

} // namespace

TEST(FeedbackControllerTest, OnlyVacantVibrates) {
    SeatFinderConfig cfg;
    FeedbackController fb(cfg);
    EXPECT_FALSE(fb.translate(stateOf(Occupancy::UNKNOWN, 0.0f)).active);
    EXPECT_FALSE(fb.translate(stateOf(Occupancy::OCCUPIED, 0.4f)).active);
    EXPECT_FALSE(fb.translate(stateOf(Occupancy::OCCUPIED, 0.0f)).active);
    EXPECT_TRUE(fb.translate(stateOf(Occupancy::VACANT, 0.0f)).active);
}

TEST(FeedbackControllerTest, VacantIntensityFallsWithConfidence) {
    SeatFinderConfig cfg;
    cfg.minIntensity = 0.3f;
    FeedbackController fb(cfg);

    EXPECT_FLOAT_EQ(fb.translate(stateOf(Occupancy::VACANT, 0.0f)).intensity, 1.0f);
    EXPECT_FLOAT_EQ(fb.translate(stateOf(Occupancy::VACANT, 1.0f)).intensity, 0.3f);

    float previous = 2.0f;
    for (int i = 0; i <= 20; i++) {
        ActuatorCommand cmd = fb.translate(stateOf(Occupancy::VACANT, i / 20.0f));
        EXPECT_TRUE(cmd.active);
        EXPECT_GE(cmd.intensity, 0.3f);
        EXPECT_LE(cmd.intensity, 1.0f);
        EXPECT_LE(cmd.intensity, previous);
        previous = cmd.intensity;
    }
}

TEST(FeedbackControllerTest, FirstApplyAlwaysDrives) {
    SeatFinderConfig cfg;
    FeedbackController fb(cfg);
    RecordingActuator motor;

    EXPECT_FALSE(fb.lastIssued().has_value());
    EXPECT_TRUE(fb.apply(stateOf(Occupancy::UNKNOWN, 0.0f), motor));
    ASSERT_EQ(motor.commands.size(), 1u);
    EXPECT_FALSE(motor.commands[0].active);
    ASSERT_TRUE(fb.lastIssued().has_value());
}

TEST(FeedbackControllerTest, RepeatedStateIsNotReissued) {
    SeatFinderConfig cfg;
    FeedbackController fb(cfg);
    RecordingActuator motor;

    DetectionState vacant = stateOf(Occupancy::VACANT, 0.01f);
    EXPECT_TRUE(fb.apply(vacant, motor));
    EXPECT_FALSE(fb.apply(vacant, motor));
    EXPECT_FALSE(fb.apply(vacant, motor));
    ASSERT_EQ(motor.commands.size(), 1u);

    DetectionState occupied = stateOf(Occupancy::OCCUPIED, 0.2f);
    EXPECT_TRUE(fb.apply(occupied, motor));
    EXPECT_FALSE(fb.apply(stateOf(Occupancy::UNKNOWN, 0.0f), motor));
    ASSERT_EQ(motor.commands.size(), 2u);
    EXPECT_FALSE(motor.commands[1].active);
}

TEST(FeedbackControllerTest, SmallIntensityChangesStayInsideDeadband) {
    SeatFinderConfig cfg;
    cfg.minIntensity = 0.3f;
    cfg.intensityDeadband = 0.05f;
    FeedbackController fb(cfg);
    RecordingActuator motor;

    fb.apply(stateOf(Occupancy::VACANT, 0.0f), motor);           // 1.0
    EXPECT_FALSE(fb.apply(stateOf(Occupancy::VACANT, 0.02f), motor)); // 0.986
    EXPECT_TRUE(fb.apply(stateOf(Occupancy::VACANT, 0.2f), motor));   // 0.86
    ASSERT_EQ(motor.commands.size(), 2u);
    EXPECT_NEAR(motor.commands[1].intensity, 0.86f, 1e-5);
    EXPECT_NEAR(fb.lastIssued()->intensity, 0.86f, 1e-5);
}

TEST(FeedbackControllerTest, ReleaseAlwaysSendsInactive) {
    SeatFinderConfig cfg;
    FeedbackController fb(cfg);
    RecordingActuator motor;

    fb.release(motor);
    fb.release(motor);
    ASSERT_EQ(motor.commands.size(), 2u);
    EXPECT_EQ(motor.commands[1], ActuatorCommand{});

    // After a release, an inactive state is already in effect
    EXPECT_FALSE(fb.apply(stateOf(Occupancy::OCCUPIED, 0.5f), motor));
    EXPECT_TRUE(fb.apply(stateOf(Occupancy::VACANT, 0.0f), motor));
    fb.release(motor);
    EXPECT_FALSE(motor.commands.back().active);
}
