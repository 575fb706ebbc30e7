#include <gtest/gtest.h>
#include <string>
#include "common/hash_utils.hpp"
#include "common/strong_hasher.hpp"

TEST(WeakHash, EmptyBlockIsZero) {
    EXPECT_EQ(HashUtils::computeWeakHash("", 0), 0u);
}

TEST(WeakHash, SumsAndPositionWeightedSums) {
    // a = 97 + 98 + 99, b = 3*97 + 2*98 + 1*99
    const std::string block = "abc";
    EXPECT_EQ(HashUtils::computeWeakHash(block.data(), block.size()), 294u + 65536u * 586u);
}

TEST(WeakHash, IsOrderSensitive) {
    EXPECT_NE(HashUtils::computeWeakHash("ab", 2), HashUtils::computeWeakHash("ba", 2));
}

TEST(WeakHash, KnownCollision) {
    const char left[] = {0, 1, 1, 0};
    const char right[] = {1, 0, 0, 1};
    EXPECT_EQ(HashUtils::computeWeakHash(left, 4), HashUtils::computeWeakHash(right, 4));
}

TEST(WeakHash, HalvesWrapAtSixteenBits) {
    std::string block(1024, '\xff');
    uint32_t hash = HashUtils::computeWeakHash(block.data(), block.size());
    EXPECT_EQ(hash & 0xffff, (255u * 1024u) % 65536u);
}

TEST(StrongHasher, Sha256KnownVector) {
    auto hasher = EvpHasher::sha256();
    hasher->write("abc", 3);
    EXPECT_EQ(HashUtils::toHex(hasher->digest()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hasher->digestSize(), 32u);
}

TEST(StrongHasher, Sha1KnownVector) {
    auto hasher = EvpHasher::sha1();
    hasher->write("abc", 3);
    EXPECT_EQ(HashUtils::toHex(hasher->digest()), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(hasher->digestSize(), 20u);
}

TEST(StrongHasher, DigestDoesNotFinalize) {
    auto hasher = EvpHasher::sha256();
    hasher->write("ab", 2);
    std::string partial = hasher->digest();
    hasher->write("c", 1);

    auto expected = EvpHasher::sha256();
    expected->write("abc", 3);
    EXPECT_EQ(hasher->digest(), expected->digest());
    EXPECT_NE(partial, expected->digest());
}

TEST(StrongHasher, ResetStartsOver) {
    auto hasher = EvpHasher::sha256();
    hasher->write("garbage", 7);
    hasher->reset();
    hasher->write("abc", 3);

    auto fresh = EvpHasher::sha256();
    fresh->write("abc", 3);
    EXPECT_EQ(hasher->digest(), fresh->digest());
}

TEST(StrongHasher, ByName) {
    auto sha1 = EvpHasher::byName("sha1");
    ASSERT_TRUE(sha1.success);
    EXPECT_EQ(sha1.data->digestSize(), 20u);

    auto unknown = EvpHasher::byName("crc32");
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(unknown.data, nullptr);
}
