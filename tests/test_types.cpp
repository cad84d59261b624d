#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "detector.hpp"
#include "types.hpp"

TEST(FrameTest, DefaultIsEmpty) {
    Frame frame;
    EXPECT_TRUE(frame.empty());
    EXPECT_EQ(frame.timestamp_ms, 0);

    frame.image = cv::Mat::zeros(4, 4, CV_8UC3);
    EXPECT_FALSE(frame.empty());
}

TEST(MonotonicClockTest, NeverGoesBackwards) {
    int64_t prev = monotonic_ms();
    for (int i = 0; i < 1000; ++i) {
        const int64_t now = monotonic_ms();
        EXPECT_GE(now, prev);
        prev = now;
    }
}

TEST(DetectionKindTest, NamesAndPairing) {
    EXPECT_STREQ(to_string(DetectionKind::Face), "face");
    EXPECT_STREQ(to_string(DetectionKind::Pose), "pose");
    EXPECT_EQ(other_kind(DetectionKind::Face), DetectionKind::Pose);
    EXPECT_EQ(other_kind(DetectionKind::Pose), DetectionKind::Face);
}

TEST(LandmarkAccessorTest, UnmeasuredFieldsAreAbsent) {
    PoseReading reading;
    reading.height_pct = 62.0;
    const LandmarkAccessor& view = reading;

    EXPECT_FALSE(view.pitch().has_value());
    EXPECT_FALSE(view.roll().has_value());
    EXPECT_FALSE(view.yaw().has_value());
    EXPECT_FALSE(view.gaze().has_value());
    ASSERT_TRUE(view.height().has_value());
    EXPECT_DOUBLE_EQ(*view.height(), 62.0);
}

TEST(FusedPoseSampleTest, AnglesNeedAllThreeAxes) {
    FusedPoseSample sample;
    EXPECT_FALSE(sample.has_angles());
    sample.pitch = 1.0;
    sample.roll = 2.0;
    EXPECT_FALSE(sample.has_angles());
    sample.yaw = 3.0;
    EXPECT_TRUE(sample.has_angles());
}

class ActuatorPayloadTest : public ::testing::Test {
protected:
    void SetUp() override {
        payload = ActuatorPayload{};
        payload.x = 0.1;
        payload.y = -0.2;
        payload.z = 0.05;
        payload.h = 50.0;
        payload.ears = 90.0;
    }

    ActuatorPayload payload;
};

TEST_F(ActuatorPayloadTest, DefaultOrientation) {
    ActuatorPayload fresh;
    EXPECT_DOUBLE_EQ(fresh.ax, 0.0);
    EXPECT_DOUBLE_EQ(fresh.ay, 0.0);
    EXPECT_DOUBLE_EQ(fresh.az, -1.0);
    EXPECT_EQ(fresh.duration_ms, 500);
}

TEST_F(ActuatorPayloadTest, WellFormedPayloadPasses) {
    EXPECT_NO_THROW(validate(payload));
}

TEST_F(ActuatorPayloadTest, NonFiniteFieldIsRejected) {
    payload.h = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validate(payload), std::invalid_argument);

    payload.h = 50.0;
    payload.z = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validate(payload), std::invalid_argument);
}

TEST_F(ActuatorPayloadTest, DurationMustBePositive) {
    payload.duration_ms = 0;
    EXPECT_THROW(validate(payload), std::invalid_argument);
    payload.duration_ms = -100;
    EXPECT_THROW(validate(payload), std::invalid_argument);
}
