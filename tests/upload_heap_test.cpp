#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "upload_heap.hpp"
#include <thread>

using namespace sectorcast;

class UploadHeapTest : public ::testing::Test {
protected:
    std::shared_ptr<UnfinishedSegment> segment(uint64_t index, int completed,
                                               bool stuck) {
        auto uc = std::make_shared<UnfinishedSegment>(SegmentId{1, index}, nullptr,
                                                      0, 4096, 4, 10, 1024);
        std::lock_guard<std::mutex> lk(uc->mu);
        uc->sectors_completed = completed;
        uc->stuck = stuck;
        return uc;
    }

    UploadHeap heap_{4};
    TaskManager tm_;
};

TEST_F(UploadHeapTest, PopsStuckThenLeastComplete) {
    ASSERT_TRUE(heap_.push(segment(0, 5, false)));
    ASSERT_TRUE(heap_.push(segment(1, 2, false)));
    ASSERT_TRUE(heap_.push(segment(2, 8, true)));
    ASSERT_TRUE(heap_.push(segment(3, 2, false)));
    EXPECT_EQ(heap_.size(), 4u);

    EXPECT_EQ(heap_.pop()->id.index, 2u);
    // Equal completion is served in arrival order.
    EXPECT_EQ(heap_.pop()->id.index, 1u);
    EXPECT_EQ(heap_.pop()->id.index, 3u);
    EXPECT_EQ(heap_.pop()->id.index, 0u);
    EXPECT_EQ(heap_.pop(), nullptr);
}

TEST_F(UploadHeapTest, RefusesQueuedOrPendingSegments) {
    ASSERT_TRUE(heap_.push(segment(0, 0, false)));
    EXPECT_FALSE(heap_.push(segment(0, 0, false)));

    auto uc = heap_.pop();
    ASSERT_NE(uc, nullptr);
    EXPECT_TRUE(heap_.is_pending(uc->id));
    EXPECT_FALSE(heap_.push(segment(0, 0, false)));

    EXPECT_TRUE(heap_.remove_pending(uc->id));
    EXPECT_TRUE(heap_.push(segment(0, 0, false)));
}

TEST_F(UploadHeapTest, PendingSetIsExact) {
    SegmentId id{3, 4};
    EXPECT_TRUE(heap_.add_pending(id));
    EXPECT_FALSE(heap_.add_pending(id));
    EXPECT_EQ(heap_.pending_count(), 1u);
    EXPECT_TRUE(heap_.remove_pending(id));
    EXPECT_FALSE(heap_.remove_pending(id));
    EXPECT_EQ(heap_.pending_count(), 0u);
}

TEST_F(UploadHeapTest, WaitIdleTracksPending) {
    EXPECT_TRUE(heap_.wait_idle(std::chrono::milliseconds(1)));
    ASSERT_TRUE(heap_.push(segment(0, 0, false)));
    EXPECT_FALSE(heap_.wait_idle(std::chrono::milliseconds(10)));
    auto uc = heap_.pop();
    EXPECT_FALSE(heap_.wait_idle(std::chrono::milliseconds(10)));

    std::thread t([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        heap_.remove_pending(uc->id);
    });
    EXPECT_TRUE(heap_.wait_idle(std::chrono::milliseconds(5000)));
    t.join();
}

TEST_F(UploadHeapTest, WaitForWork) {
    EXPECT_FALSE(heap_.wait_for_work(tm_, std::chrono::milliseconds(10)));
    std::thread t([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        heap_.push(segment(0, 0, false));
    });
    EXPECT_TRUE(heap_.wait_for_work(tm_, std::chrono::milliseconds(5000)));
    t.join();

    tm_.stop();
    EXPECT_FALSE(heap_.wait_for_work(tm_, std::chrono::milliseconds(5000)));
}
