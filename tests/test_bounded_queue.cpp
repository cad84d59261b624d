#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "bounded_queue.hpp"
#include "worker_thread.hpp"

using namespace std::chrono_literals;

class BoundedQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue = std::make_unique<BoundedQueue<int>>(3);
    }

    std::unique_ptr<BoundedQueue<int>> queue;
};

TEST_F(BoundedQueueTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST_F(BoundedQueueTest, FifoOrder) {
    EXPECT_TRUE(queue->try_push(1));
    EXPECT_TRUE(queue->try_push(2));
    EXPECT_EQ(queue->pop_for(0ms), 1);
    EXPECT_EQ(queue->pop_for(0ms), 2);
    EXPECT_FALSE(queue->pop_for(0ms).has_value());
}

TEST_F(BoundedQueueTest, PushFailsWhenFull) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(queue->try_push(i));
    }
    EXPECT_FALSE(queue->try_push(99));
    EXPECT_EQ(queue->size(), 3u);
    EXPECT_EQ(queue->capacity(), 3u);
}

TEST_F(BoundedQueueTest, PopTimesOutOnEmptyQueue) {
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue->pop_for(30ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 25ms);
}

TEST_F(BoundedQueueTest, CloseWakesWaitingConsumer) {
    std::atomic<bool> returned{false};
    std::thread consumer([&] {
        queue->pop_for(5s);
        returned = true;
    });
    std::this_thread::sleep_for(20ms);
    const auto t0 = std::chrono::steady_clock::now();
    queue->close();
    consumer.join();
    EXPECT_TRUE(returned);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
}

TEST_F(BoundedQueueTest, ClosedQueueRejectsPushUntilReopened) {
    queue->try_push(7);
    queue->close();
    EXPECT_TRUE(queue->closed());
    EXPECT_FALSE(queue->try_push(8));
    // Items already queued can still be drained.
    EXPECT_EQ(queue->pop_for(0ms), 7);

    queue->reopen();
    EXPECT_TRUE(queue->try_push(9));
}

TEST_F(BoundedQueueTest, ClearDropsEverything) {
    queue->try_push(1);
    queue->try_push(2);
    queue->clear();
    EXPECT_EQ(queue->size(), 0u);
}

TEST_F(BoundedQueueTest, ConcurrentProducersNeverExceedCapacity) {
    BoundedQueue<int> q(16);
    std::atomic<int> accepted{0};
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                if (q.try_push(i)) accepted++;
                EXPECT_LE(q.size(), 16u);
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }
    EXPECT_EQ(accepted.load(), 16);
}

TEST(WorkerThreadTest, JoinBeforeStartIsSafe) {
    WorkerThread w;
    w.request_stop();
    EXPECT_TRUE(w.join_for(0ms));
    w.join();
    EXPECT_FALSE(w.running());
}

TEST(WorkerThreadTest, CooperativeStop) {
    WorkerThread w;
    std::atomic<int> spins{0};
    ASSERT_TRUE(w.start([&] {
        while (!w.stop_requested()) {
            spins++;
            std::this_thread::sleep_for(1ms);
        }
    }));
    std::this_thread::sleep_for(10ms);
    EXPECT_TRUE(w.running());
    w.request_stop();
    EXPECT_TRUE(w.join_for(500ms));
    EXPECT_FALSE(w.running());
    EXPECT_GT(spins.load(), 0);
}

TEST(WorkerThreadTest, JoinForReportsTimeout) {
    WorkerThread w;
    std::atomic<bool> release{false};
    ASSERT_TRUE(w.start([&] {
        while (!release) std::this_thread::sleep_for(1ms);
    }));
    w.request_stop();
    EXPECT_FALSE(w.join_for(20ms));
    EXPECT_TRUE(w.running());
    release = true;
    EXPECT_TRUE(w.join_for(500ms));
}

TEST(WorkerThreadTest, RestartAfterJoin) {
    WorkerThread w;
    std::atomic<int> runs{0};
    ASSERT_TRUE(w.start([&] { runs++; }));
    EXPECT_TRUE(w.join_for(500ms));
    ASSERT_TRUE(w.start([&] { runs++; }));
    EXPECT_TRUE(w.join_for(500ms));
    EXPECT_EQ(runs.load(), 2);
}

TEST(WorkerThreadTest, StartRefusedWhileUnjoined) {
    WorkerThread w;
    std::atomic<bool> release{false};
    ASSERT_TRUE(w.start([&] {
        while (!release) std::this_thread::sleep_for(1ms);
    }));
    EXPECT_FALSE(w.start([] {}));
    release = true;
    w.join();
}

TEST(WorkerThreadDeathTest, ThrowingBodyTerminates) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_DEATH(
        {
            WorkerThread w;
            w.start([] { throw std::runtime_error("contract violation"); });
            w.join();
        },
        "");
}
