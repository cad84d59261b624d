#include <gtest/gtest.h>
#include <chrono>
#include <random>
#include <thread>
#include <vector>
#include "correlation_buffer.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

namespace {

DetectionResult face_result(int64_t ts, double pitch = 1.0, double roll = 2.0, double yaw = 3.0) {
    return DetectionResult{DetectionKind::Face, ts, face_reading(pitch, roll, yaw, 0.4)};
}

DetectionResult pose_result(int64_t ts, double height = 70.0) {
    return DetectionResult{DetectionKind::Pose, ts, body_reading(height)};
}

CorrelationConfig strict_config(int64_t tolerance_ms = 0, int64_t max_delay_ms = 200) {
    CorrelationConfig cfg;
    cfg.policy = FusionPolicy::StrictPairing;
    cfg.tolerance_ms = tolerance_ms;
    cfg.max_delay_ms = max_delay_ms;
    return cfg;
}

}  // namespace

class IndependentLatestTest : public ::testing::Test {
protected:
    void SetUp() override {
        buffer = std::make_unique<CorrelationBuffer>(CorrelationConfig{}, quiet_logger());
    }

    void add(const DetectionResult& r) { buffer->add(r.kind, r, r.timestamp_ms); }

    std::unique_ptr<CorrelationBuffer> buffer;
};

TEST_F(IndependentLatestTest, EmptyBufferHasNoSample) {
    EXPECT_FALSE(buffer->latest().has_value());
    EXPECT_FALSE(buffer->is_fresh(1000ms));
    EXPECT_EQ(buffer->size(), 0u);
}

TEST_F(IndependentLatestTest, FaceAlonePublishesPartialSample) {
    add(face_result(100, 5.0, -2.0, 12.0));

    auto s = buffer->latest();
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->timestamp_ms, 100);
    EXPECT_DOUBLE_EQ(*s->pitch, 5.0);
    EXPECT_DOUBLE_EQ(*s->roll, -2.0);
    EXPECT_DOUBLE_EQ(*s->yaw, 12.0);
    EXPECT_FALSE(s->height.has_value());
    ASSERT_TRUE(s->gaze.has_value());
    EXPECT_DOUBLE_EQ(s->gaze->ratio, 0.4);
    EXPECT_TRUE(buffer->is_fresh(1000ms));
}

TEST_F(IndependentLatestTest, FreshnessAgesOut) {
    add(face_result(100));
    ASSERT_TRUE(buffer->is_fresh(1000ms));

    std::this_thread::sleep_for(40ms);
    EXPECT_FALSE(buffer->is_fresh(20ms));
    EXPECT_TRUE(buffer->is_fresh(1000ms));

    add(face_result(200));
    EXPECT_TRUE(buffer->is_fresh(20ms));
}

TEST_F(IndependentLatestTest, MergesWithOtherKindInsideValidityWindow) {
    add(pose_result(100, 64.0));
    add(face_result(150));

    auto s = buffer->latest();
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->has_angles());
    ASSERT_TRUE(s->height.has_value());
    EXPECT_DOUBLE_EQ(*s->height, 64.0);
}

TEST_F(IndependentLatestTest, StaleOtherKindIsExcluded) {
    // Pose results stay valid for 500 ms.
    add(pose_result(100, 64.0));
    add(face_result(601));

    auto s = buffer->latest();
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->has_angles());
    EXPECT_FALSE(s->height.has_value());
}

TEST_F(IndependentLatestTest, FaceValidityWindowAppliesToPoseArrivals) {
    add(face_result(100));
    add(pose_result(250));
    EXPECT_TRUE(buffer->latest()->has_angles());

    add(pose_result(400));
    auto s = buffer->latest();
    ASSERT_TRUE(s.has_value());
    EXPECT_FALSE(s->has_angles());
    EXPECT_DOUBLE_EQ(*s->height, 70.0);
}

TEST_F(IndependentLatestTest, ResultWithoutLandmarksIsIgnored) {
    DetectionResult empty{DetectionKind::Face, 10, nullptr};
    add(empty);
    EXPECT_EQ(buffer->size(), 0u);
}

TEST_F(IndependentLatestTest, TimestampsStrictlyIncrease) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int64_t> ts(0, 50);
    for (int i = 0; i < 200; ++i) {
        const int64_t t = ts(rng);
        if (i % 2 == 0) {
            add(face_result(t));
        } else {
            add(pose_result(t));
        }
    }
    auto samples = buffer->snapshot();
    ASSERT_FALSE(samples.empty());
    for (size_t i = 1; i < samples.size(); ++i) {
        EXPECT_GT(samples[i].timestamp_ms, samples[i - 1].timestamp_ms);
    }
}

TEST_F(IndependentLatestTest, DuplicateTimestampIsBumped) {
    add(face_result(100));
    add(face_result(100));
    add(face_result(90));

    auto samples = buffer->snapshot();
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0].timestamp_ms, 100);
    EXPECT_EQ(samples[1].timestamp_ms, 101);
    EXPECT_EQ(samples[2].timestamp_ms, 102);
}

TEST_F(IndependentLatestTest, RingKeepsNewestThirty) {
    for (int64_t t = 1; t <= 45; ++t) {
        add(face_result(t * 10, static_cast<double>(t)));
    }
    auto samples = buffer->snapshot();
    ASSERT_EQ(samples.size(), 30u);
    EXPECT_DOUBLE_EQ(*samples.front().pitch, 16.0);
    EXPECT_DOUBLE_EQ(*samples.back().pitch, 45.0);
    EXPECT_EQ(buffer->latest()->timestamp_ms, 450);
}

TEST_F(IndependentLatestTest, ClearForgetsEverything) {
    add(face_result(100));
    buffer->clear();
    EXPECT_FALSE(buffer->latest().has_value());
    // After clear the timestamp sequence may restart.
    add(face_result(5));
    EXPECT_EQ(buffer->latest()->timestamp_ms, 5);
}

TEST_F(IndependentLatestTest, ConcurrentWritersAndReaders) {
    std::atomic<bool> done{false};
    std::thread reader([&] {
        int64_t prev = -1;
        while (!done) {
            auto s = buffer->latest();
            if (s) {
                EXPECT_GT(s->timestamp_ms, prev - 1);
                prev = s->timestamp_ms;
            }
        }
    });
    std::vector<std::thread> writers;
    for (int k = 0; k < 2; ++k) {
        writers.emplace_back([&, k] {
            for (int64_t t = 0; t < 500; ++t) {
                if (k == 0) {
                    add(face_result(t));
                } else {
                    add(pose_result(t));
                }
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    done = true;
    reader.join();

    EXPECT_LE(buffer->size(), 30u);
    auto samples = buffer->snapshot();
    for (size_t i = 1; i < samples.size(); ++i) {
        EXPECT_GT(samples[i].timestamp_ms, samples[i - 1].timestamp_ms);
    }
}

class StrictPairingTest : public ::testing::Test {
protected:
    void make(CorrelationConfig cfg) {
        buffer = std::make_unique<CorrelationBuffer>(cfg, quiet_logger());
    }

    void add(const DetectionResult& r) { buffer->add(r.kind, r, r.timestamp_ms); }

    std::unique_ptr<CorrelationBuffer> buffer;
};

TEST_F(StrictPairingTest, UnpairedResultIsNotPublished) {
    make(strict_config());
    add(face_result(100));
    EXPECT_FALSE(buffer->latest().has_value());
    EXPECT_EQ(buffer->pending_size(), 1u);
}

TEST_F(StrictPairingTest, MatchingTimestampsFuse) {
    make(strict_config());
    add(face_result(100, 4.0));
    add(pose_result(100, 55.0));

    auto s = buffer->latest();
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->timestamp_ms, 100);
    EXPECT_DOUBLE_EQ(*s->pitch, 4.0);
    EXPECT_DOUBLE_EQ(*s->height, 55.0);
    EXPECT_EQ(buffer->pending_size(), 0u);
}

TEST_F(StrictPairingTest, ToleranceWindowPairsNearbyTimestamps) {
    make(strict_config(5));
    add(pose_result(100));
    add(face_result(104));
    ASSERT_TRUE(buffer->latest().has_value());
    EXPECT_EQ(buffer->latest()->timestamp_ms, 100);

    add(pose_result(200));
    add(face_result(206));
    EXPECT_EQ(buffer->size(), 1u);
    EXPECT_EQ(buffer->pending_size(), 2u);
}

TEST_F(StrictPairingTest, OutOfOrderCompletionDoesNotStall) {
    make(strict_config());
    add(face_result(100));
    add(face_result(133));
    add(pose_result(133));

    // Pairing 133 drops the older unmatched 100.
    EXPECT_EQ(buffer->latest()->timestamp_ms, 133);
    EXPECT_EQ(buffer->pending_size(), 0u);
}

TEST_F(StrictPairingTest, StaleEntriesAreEvictedAfterMaxDelay) {
    make(strict_config(0, 20));
    add(face_result(100));
    std::this_thread::sleep_for(40ms);
    add(face_result(200));

    EXPECT_EQ(buffer->pending_size(), 1u);
    EXPECT_EQ(buffer->evicted_count(), 1u);
    add(pose_result(100));
    EXPECT_FALSE(buffer->latest().has_value());
}

TEST(CorrelationConfigTest, PolicyNames) {
    EXPECT_EQ(parse_fusion_policy("independent_latest"), FusionPolicy::IndependentLatest);
    EXPECT_EQ(parse_fusion_policy("strict_pairing"), FusionPolicy::StrictPairing);
    EXPECT_STREQ(to_string(FusionPolicy::StrictPairing), "strict_pairing");
    EXPECT_THROW(parse_fusion_policy("newest"), std::invalid_argument);
}

TEST(CorrelationConfigTest, InvalidWindowsAreRejected) {
    CorrelationConfig cfg;
    cfg.ring_capacity = 0;
    EXPECT_THROW(CorrelationBuffer{cfg}, std::invalid_argument);

    cfg = CorrelationConfig{};
    cfg.face_timeout_ms = -1;
    EXPECT_THROW(CorrelationBuffer{cfg}, std::invalid_argument);
}
