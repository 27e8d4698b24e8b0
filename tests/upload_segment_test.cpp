#include <gtest/gtest.h>
#include "upload_segment.hpp"
#include <set>
#include <string>

using namespace sectorcast;

class UploadSegmentTest : public ::testing::Test {
protected:
    UnfinishedSegment uc_{SegmentId{1, 0}, nullptr, 0, 4096, 4, 10, 1024};
};

TEST_F(UploadSegmentTest, CompleteWhenEverySectorUploaded) {
    std::lock_guard<std::mutex> lk(uc_.mu);
    uc_.sectors_completed = 10;
    uc_.sectors_uploading = 0;
    uc_.workers_remaining = 3;
    EXPECT_TRUE(uc_.upload_complete());
}

TEST_F(UploadSegmentTest, CompleteWhenNoWorkersLeft) {
    std::lock_guard<std::mutex> lk(uc_.mu);
    uc_.sectors_completed = 6;
    uc_.sectors_uploading = 0;
    uc_.workers_remaining = 0;
    EXPECT_TRUE(uc_.upload_complete());
}

TEST_F(UploadSegmentTest, NotCompleteWhileUploading) {
    std::lock_guard<std::mutex> lk(uc_.mu);
    uc_.sectors_uploading = 1;
    uc_.sectors_completed = 10;
    uc_.workers_remaining = 0;
    EXPECT_FALSE(uc_.upload_complete());
    uc_.sectors_completed = 3;
    EXPECT_FALSE(uc_.upload_complete());
    uc_.workers_remaining = 5;
    EXPECT_FALSE(uc_.upload_complete());
}

TEST_F(UploadSegmentTest, NotCompleteWhileWorkersRemain) {
    std::lock_guard<std::mutex> lk(uc_.mu);
    uc_.sectors_completed = 6;
    uc_.workers_remaining = 2;
    EXPECT_FALSE(uc_.upload_complete());
}

TEST_F(UploadSegmentTest, SlotsStartFree) {
    std::lock_guard<std::mutex> lk(uc_.mu);
    EXPECT_EQ(uc_.sector_slots.size(), 10u);
    EXPECT_EQ(uc_.slots_claimed(), 0);
    uc_.sector_slots[3] = true;
    EXPECT_EQ(uc_.slots_claimed(), 1);
}

TEST_F(UploadSegmentTest, StateTransitions) {
    EXPECT_EQ(uc_.state(), SegmentState::Created);
    uc_.set_state(SegmentState::Dispatched);
    EXPECT_EQ(uc_.state(), SegmentState::Dispatched);
    EXPECT_STREQ(segment_state_str(uc_.state()), "dispatched");
    EXPECT_EQ(uc_.describe(), "1/0");
}

TEST_F(UploadSegmentTest, EveryStateHasItsOwnName) {
    const SegmentState states[] = {
        SegmentState::Created,    SegmentState::RetrievingData,
        SegmentState::Encoding,   SegmentState::Encrypting,
        SegmentState::Dispatched, SegmentState::Completing,
        SegmentState::Stuck,      SegmentState::Released};
    std::set<std::string> names;
    for (SegmentState s : states)
        names.insert(segment_state_str(s));
    EXPECT_EQ(names.size(), 8u);
    EXPECT_STREQ(segment_state_str(SegmentState::Released), "released");
    EXPECT_EQ(names.count("unknown"), 0u);
}

TEST(RepairThresholdTest, StuckThreshold) {
    EXPECT_TRUE(repair_successful(9, 10, 0.1));
    EXPECT_FALSE(repair_successful(8, 10, 0.1));
    EXPECT_TRUE(repair_successful(10, 10, 0.1));
    EXPECT_TRUE(repair_successful(6, 6, 0.0));
    EXPECT_FALSE(repair_successful(5, 6, 0.0));
}

TEST(RepairThresholdTest, NeedsDownload) {
    // 2 redundant sectors * 0.125 rounds down to 0 allowed missing.
    EXPECT_TRUE(needs_download(0, 4, 6, 0.125));
    EXPECT_TRUE(needs_download(5, 4, 6, 0.125));
    EXPECT_FALSE(needs_download(6, 4, 6, 0.125));
    // 20 redundant sectors * 0.25 allows 5 missing.
    EXPECT_TRUE(needs_download(24, 10, 30, 0.25));
    EXPECT_FALSE(needs_download(25, 10, 30, 0.25));
}
