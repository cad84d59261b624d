#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "fakes.hpp"
#include "frame_source.hpp"

using namespace std::chrono_literals;

class FrameSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_unique<ScriptedFrameSource>();
    }

    void TearDown() override {
        source->stop();
        EXPECT_TRUE(source->join_for(1000ms));
    }

    std::unique_ptr<ScriptedFrameSource> source;
};

TEST_F(FrameSourceTest, NotReadyBeforeFirstFrame) {
    EXPECT_FALSE(source->latest().has_value());
}

TEST_F(FrameSourceTest, LatestFrameAfterStart) {
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->latest().has_value(); }));

    auto frame = source->latest();
    EXPECT_EQ(frame->image.cols, 64);
    EXPECT_EQ(frame->image.rows, 48);
    EXPECT_GT(frame->timestamp_ms, 0);
}

TEST_F(FrameSourceTest, OverwritesInsteadOfQueueing) {
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->frames_captured() >= 5; }));
    auto a = source->latest();
    ASSERT_TRUE(wait_until([&] { return source->frames_captured() >= 10; }));
    auto b = source->latest();
    ASSERT_TRUE(a && b);
    EXPECT_GE(b->timestamp_ms, a->timestamp_ms);
    EXPECT_NE(a->image.at<cv::Vec3b>(1, 1), b->image.at<cv::Vec3b>(1, 1));
}

TEST_F(FrameSourceTest, CopiesNeverAliasTheSlot) {
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->latest().has_value(); }));
    auto a = source->latest();
    auto b = source->latest();
    ASSERT_TRUE(a && b);
    EXPECT_NE(a->image.data, b->image.data);
    a->image.setTo(cv::Scalar(0, 0, 0));
    EXPECT_NE(b->image.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
}

TEST_F(FrameSourceTest, ResizeAndMirrorOptions) {
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->latest().has_value(); }));

    FrameOptions opts;
    opts.width = 32;
    opts.height = 24;
    auto small = source->latest(opts);
    ASSERT_TRUE(small.has_value());
    EXPECT_EQ(small->image.cols, 32);
    EXPECT_EQ(small->image.rows, 24);

    FrameOptions mirror;
    mirror.mirror = true;
    auto flipped = source->latest(mirror);
    ASSERT_TRUE(flipped.has_value());
    // The white marker moves from the left edge to the right edge.
    EXPECT_EQ(flipped->image.at<cv::Vec3b>(0, 63), cv::Vec3b(255, 255, 255));
}

TEST_F(FrameSourceTest, OpenFailureReported) {
    ScriptedFrameSource broken(false);
    EXPECT_FALSE(broken.start());
    EXPECT_FALSE(broken.running());
}

TEST_F(FrameSourceTest, ReadFailuresAreCountedAndSurvived) {
    source->produce = false;
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->read_failures() >= 3; }));
    EXPECT_TRUE(source->running());
    EXPECT_FALSE(source->latest().has_value());

    source->produce = true;
    EXPECT_TRUE(wait_until([&] { return source->latest().has_value(); }));
}

TEST_F(FrameSourceTest, StopReleasesDeviceWithinOneCycle) {
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->frames_captured() > 0; }));

    const auto t0 = std::chrono::steady_clock::now();
    source->stop();
    EXPECT_TRUE(source->join_for(500ms));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 100ms);
    EXPECT_TRUE(source->released);
    EXPECT_FALSE(source->running());

    // Idempotent.
    source->stop();
    EXPECT_TRUE(source->join_for(0ms));
}

TEST_F(FrameSourceTest, RestartDropsThePreviousFrame) {
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->latest().has_value(); }));
    source->stop();
    ASSERT_TRUE(source->join_for(500ms));

    source->produce = false;
    ASSERT_TRUE(source->start());
    EXPECT_FALSE(source->latest().has_value());
    ASSERT_TRUE(wait_until([&] { return source->read_failures() >= 2; }));
    EXPECT_FALSE(source->latest().has_value());
}

TEST_F(FrameSourceTest, StopBeforeStartIsSafe) {
    source->stop();
    EXPECT_TRUE(source->join_for(0ms));
    EXPECT_FALSE(source->released);
}

TEST_F(FrameSourceTest, ConcurrentReaders) {
    ASSERT_TRUE(source->start());
    ASSERT_TRUE(wait_until([&] { return source->latest().has_value(); }));
    std::vector<std::thread> readers;
    std::atomic<int> reads{0};
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                if (source->latest(FrameOptions{16, 12, true})) reads++;
            }
        });
    }
    for (auto& r : readers) {
        r.join();
    }
    EXPECT_EQ(reads.load(), 400);
    EXPECT_TRUE(source->running());
}
