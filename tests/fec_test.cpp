#include <gtest/gtest.h>
#include "fec.hpp"
#include "test_utils.hpp"

using namespace sectorcast;

class ReedSolomonTest : public ::testing::Test {
protected:
    ReedSolomon rs_{ErasurePlan{4, 6, 64}};
    std::vector<uint8_t> data_ = test_utils::pattern_bytes(4 * 64, 7);
};

TEST_F(ReedSolomonTest, EncodeIsSystematic) {
    ASSERT_TRUE(rs_.valid());
    std::vector<std::vector<uint8_t>> sectors;
    ASSERT_TRUE(rs_.encode(data_, sectors));
    ASSERT_EQ(sectors.size(), 6u);
    for (int i = 0; i < 4; i++) {
        ASSERT_EQ(sectors[i].size(), 64u);
        EXPECT_TRUE(std::equal(sectors[i].begin(), sectors[i].end(),
                               data_.begin() + i * 64));
    }
    EXPECT_EQ(sectors[4].size(), 64u);
    EXPECT_EQ(sectors[5].size(), 64u);
}

TEST_F(ReedSolomonTest, RecoversFromAnyMinSectors) {
    std::vector<std::vector<uint8_t>> sectors;
    ASSERT_TRUE(rs_.encode(data_, sectors));

    // Every way of losing two of the six sectors.
    for (int a = 0; a < 6; a++) {
        for (int b = a + 1; b < 6; b++) {
            std::vector<bool> mask(6, true);
            mask[a] = mask[b] = false;
            auto damaged = sectors;
            damaged[a].clear();
            damaged[b].clear();
            std::vector<uint8_t> out;
            ASSERT_TRUE(rs_.recover(damaged, mask, out)) << a << "," << b;
            EXPECT_EQ(out, data_) << a << "," << b;
        }
    }
}

TEST_F(ReedSolomonTest, RecoveryNeedsMinSectors) {
    std::vector<std::vector<uint8_t>> sectors;
    ASSERT_TRUE(rs_.encode(data_, sectors));
    std::vector<bool> mask = {true, false, true, false, true, false};
    std::vector<uint8_t> out;
    EXPECT_FALSE(rs_.recover(sectors, mask, out));
}

TEST_F(ReedSolomonTest, ShortInputIsZeroPadded) {
    std::vector<uint8_t> small(100, 0xAB);
    std::vector<std::vector<uint8_t>> sectors;
    ASSERT_TRUE(rs_.encode(small, sectors));
    std::vector<bool> mask = {false, false, true, true, true, true};
    std::vector<uint8_t> out;
    ASSERT_TRUE(rs_.recover(sectors, mask, out));
    ASSERT_EQ(out.size(), 4u * 64);
    EXPECT_TRUE(std::equal(small.begin(), small.end(), out.begin()));
    for (size_t i = small.size(); i < out.size(); i++)
        ASSERT_EQ(out[i], 0);
}

TEST_F(ReedSolomonTest, OversizedInputFails) {
    std::vector<uint8_t> big(4 * 64 + 1, 1);
    std::vector<std::vector<uint8_t>> sectors;
    EXPECT_FALSE(rs_.encode(big, sectors));
    EXPECT_TRUE(sectors.empty());
}

TEST(ReedSolomonPlanTest, RejectsInvalidPlans) {
    EXPECT_FALSE(ReedSolomon(ErasurePlan{0, 4, 64}).valid());
    EXPECT_FALSE(ReedSolomon(ErasurePlan{5, 4, 64}).valid());
    EXPECT_FALSE(ReedSolomon(ErasurePlan{4, 300, 64}).valid());
    EXPECT_FALSE(ReedSolomon(ErasurePlan{4, 6, 0}).valid());
    EXPECT_TRUE(ReedSolomon(ErasurePlan{1, 1, 8}).valid());
}
