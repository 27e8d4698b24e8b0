#include <gtest/gtest.h>
#include "memory_manager.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace sectorcast;
using test_utils::eventually;

class MemoryManagerTest : public ::testing::Test {
protected:
    TaskManager tm_;
    MemoryManager mm_{100, tm_};
};

TEST_F(MemoryManagerTest, GrantsWithinLimit) {
    EXPECT_TRUE(mm_.acquire(60));
    EXPECT_EQ(mm_.available(), 40u);
    EXPECT_EQ(mm_.outstanding(), 60u);
    EXPECT_TRUE(mm_.acquire(40));
    EXPECT_EQ(mm_.available(), 0u);
    mm_.release(100);
    EXPECT_EQ(mm_.available(), 100u);
}

TEST_F(MemoryManagerTest, BlocksUntilReleased) {
    ASSERT_TRUE(mm_.acquire(80));
    std::atomic<bool> granted{false};
    std::thread t([&] { granted = mm_.acquire(50); });

    ASSERT_TRUE(eventually([&] { return mm_.waiters() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(granted);

    mm_.release(80);
    t.join();
    EXPECT_TRUE(granted);
    EXPECT_EQ(mm_.outstanding(), 50u);
}

TEST_F(MemoryManagerTest, ServesWaitersInArrivalOrder) {
    ASSERT_TRUE(mm_.acquire(100));
    std::atomic<int> order{0};
    int big_pos = -1, small_pos = -1;

    std::thread big([&] {
        ASSERT_TRUE(mm_.acquire(60));
        big_pos = order++;
    });
    ASSERT_TRUE(eventually([&] { return mm_.waiters() == 1; }));
    std::thread small([&] {
        ASSERT_TRUE(mm_.acquire(10));
        small_pos = order++;
    });
    ASSERT_TRUE(eventually([&] { return mm_.waiters() == 2; }));

    // Enough for the later, smaller request but not the first one.
    mm_.release(30);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(order.load(), 0);

    mm_.release(70);
    big.join();
    small.join();
    EXPECT_EQ(big_pos, 0);
    EXPECT_EQ(small_pos, 1);
    EXPECT_EQ(mm_.outstanding(), 70u);
}

TEST_F(MemoryManagerTest, StopInterruptsWaiters) {
    ASSERT_TRUE(mm_.acquire(100));
    std::atomic<int> results{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; i++)
        waiters.emplace_back([&] {
            if (!mm_.acquire(20))
                results++;
        });
    ASSERT_TRUE(eventually([&] { return mm_.waiters() == 3; }));

    tm_.stop();
    for (auto& t : waiters)
        t.join();
    EXPECT_EQ(results.load(), 3);
    EXPECT_FALSE(mm_.acquire(1));
}

TEST_F(MemoryManagerTest, RefusesRequestLargerThanLimit) {
    EXPECT_FALSE(mm_.acquire(101));
    EXPECT_EQ(mm_.available(), 100u);
    EXPECT_EQ(mm_.waiters(), 0u);
}

TEST_F(MemoryManagerTest, OverReleaseIsClamped) {
    ASSERT_TRUE(mm_.acquire(10));
    mm_.release(50);
    EXPECT_EQ(mm_.available(), 100u);
    EXPECT_EQ(mm_.outstanding(), 0u);
}

TEST_F(MemoryManagerTest, OutstandingNeverExceedsLimit) {
    std::atomic<bool> over{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++)
        threads.emplace_back([&, i] {
            for (int k = 0; k < 200; k++) {
                uint64_t n = 5 + (uint64_t)((i * 7 + k) % 30);
                if (!mm_.acquire(n))
                    return;
                if (mm_.outstanding() > mm_.limit())
                    over = true;
                mm_.release(n);
            }
        });
    for (auto& t : threads)
        t.join();
    EXPECT_FALSE(over);
    EXPECT_EQ(mm_.outstanding(), 0u);
}
