#include "segx_protocol.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <vector>

namespace {

std::vector<uint8_t> random_bytes(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<uint8_t> out(n);
    for (auto& b : out) b = static_cast<uint8_t>(byte(rng));
    return out;
}

} // namespace

TEST(Checksum, MatchesRfc1071Example) {
    std::vector<uint8_t> data = { 0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7 };
    EXPECT_EQ(segx_checksum16(data), 0x220d);
}

TEST(Checksum, EmptyBufferIsAllOnes) {
    EXPECT_EQ(segx_checksum16(std::vector<uint8_t>{}), 0xFFFF);
}

TEST(Checksum, OddLengthIsPaddedWithZero) {
    EXPECT_EQ(segx_checksum16(std::vector<uint8_t>{ 0xAB }), 0x54FF);
    EXPECT_EQ(segx_checksum16(std::vector<uint8_t>{ 0x01, 0x02, 0x03 }), 0xFBFD);
    EXPECT_EQ(segx_checksum16(std::vector<uint8_t>{ 0x01, 0x02, 0x03 }),
              segx_checksum16(std::vector<uint8_t>{ 0x01, 0x02, 0x03, 0x00 }));
}

TEST(Checksum, FoldsCarries) {
    // 0xFFFF + 0x0001 = 0x10000 -> folds to 0x0001 -> complement 0xFFFE
    EXPECT_EQ(segx_checksum16(std::vector<uint8_t>{ 0xFF, 0xFF, 0x00, 0x01 }), 0xFFFE);
}

TEST(Checksum, DeterministicAcrossIndependentBuffers) {
    auto a = random_bytes(1000, 11);
    auto b = random_bytes(1000, 11);
    ASSERT_NE(a.data(), b.data());
    EXPECT_EQ(segx_checksum16(a), segx_checksum16(a));
    EXPECT_EQ(segx_checksum16(a), segx_checksum16(b));
}

TEST(Checksum, VerifyDoesNotModifyInput) {
    auto data = random_bytes(513, 5);
    auto copy = data;
    uint16_t sum = segx_checksum16(data);
    EXPECT_TRUE(segx_verify_checksum(data, sum));
    EXPECT_FALSE(segx_verify_checksum(data, static_cast<uint16_t>(sum ^ 0x0100)));
    EXPECT_EQ(data, copy);
}

TEST(Checksum, DetectsPlusOneCorruptionAtEveryPosition) {
    for (uint32_t seed : { 1u, 2u, 3u }) {
        auto original = random_bytes(kSegmentSize - seed, seed);  // odd and even lengths
        uint16_t sum = segx_checksum16(original);

        for (size_t pos = 0; pos < original.size(); ++pos) {
            auto corrupted = original;
            corrupted[pos] = static_cast<uint8_t>(corrupted[pos] + 1);
            EXPECT_FALSE(segx_verify_checksum(corrupted, sum)) << "seed " << seed << " pos " << pos;
        }
    }
}

TEST(Checksum, DetectsWrapAroundCorruption) {
    for (uint8_t fill : { uint8_t{ 0x00 }, uint8_t{ 0xFF } }) {
        std::vector<uint8_t> original(64, fill);
        uint16_t sum = segx_checksum16(original);
        for (size_t pos = 0; pos < original.size(); ++pos) {
            auto corrupted = original;
            corrupted[pos] = static_cast<uint8_t>(corrupted[pos] + 1);
            EXPECT_FALSE(segx_verify_checksum(corrupted, sum)) << "fill " << int(fill) << " pos " << pos;
        }
    }
}
