#include <gtest/gtest.h>
#include "crypto.hpp"
#include "test_utils.hpp"

using namespace sectorcast;

class SodiumAeadTest : public ::testing::Test {
protected:
    void SetUp() override { aead_.set_key(test_utils::pattern_bytes(32, 5)); }

    SodiumAead aead_;
};

TEST_F(SodiumAeadTest, SameSectorNeverReusesNonce) {
    // Same coordinates, different contents: what a re-upload after the
    // local file changed, or a new file with a recycled id, looks like.
    auto a = test_utils::pattern_bytes(256, 1);
    auto b = test_utils::pattern_bytes(256, 2);
    auto ca = a, cb = b, ca2 = a;
    ASSERT_TRUE(aead_.encrypt(1, 0, 0, ca));
    ASSERT_TRUE(aead_.encrypt(1, 0, 0, cb));
    ASSERT_TRUE(aead_.encrypt(1, 0, 0, ca2));
    ASSERT_EQ(ca.size(), 256u + SodiumAead::overhead());

    const size_t nonce = SodiumAead::overhead() - 16;
    EXPECT_FALSE(std::equal(ca.begin(), ca.begin() + nonce, cb.begin()));
    EXPECT_NE(ca, ca2);

    ASSERT_TRUE(aead_.decrypt(1, 0, 0, ca));
    ASSERT_TRUE(aead_.decrypt(1, 0, 0, cb));
    ASSERT_TRUE(aead_.decrypt(1, 0, 0, ca2));
    EXPECT_EQ(ca, a);
    EXPECT_EQ(cb, b);
    EXPECT_EQ(ca2, a);
}

TEST_F(SodiumAeadTest, SectorDecryptsOnlyAtItsPosition) {
    auto plain = test_utils::pattern_bytes(100, 3);
    auto c = plain;
    ASSERT_TRUE(aead_.encrypt(7, 2, 4, c));

    auto moved = c;
    EXPECT_FALSE(aead_.decrypt(7, 2, 5, moved));
    moved = c;
    EXPECT_FALSE(aead_.decrypt(7, 3, 4, moved));
    moved = c;
    EXPECT_FALSE(aead_.decrypt(8, 2, 4, moved));

    auto tampered = c;
    tampered[SodiumAead::overhead()] ^= 1;
    EXPECT_FALSE(aead_.decrypt(7, 2, 4, tampered));

    ASSERT_TRUE(aead_.decrypt(7, 2, 4, c));
    EXPECT_EQ(c, plain);
}

TEST(SodiumAeadKeyTest, EmptyKeyRefusesToEncrypt) {
    SodiumAead aead;
    aead.set_key({});
    std::vector<uint8_t> buf(32, 1);
    EXPECT_FALSE(aead.encrypt(1, 0, 0, buf));
    EXPECT_EQ(buf, std::vector<uint8_t>(32, 1));

    SodiumAead other;
    other.set_key(test_utils::pattern_bytes(32, 6));
    std::vector<uint8_t> c(32, 1);
    ASSERT_TRUE(other.encrypt(1, 0, 0, c));
    EXPECT_FALSE(aead.decrypt(1, 0, 0, c));
}
