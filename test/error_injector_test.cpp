#include "ErrorInjector.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

std::vector<uint8_t> make_payload(size_t n) {
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(i * 7);
    return out;
}

size_t differing_bytes(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    size_t n = 0;
    for (size_t i = 0; i < a.size(); ++i) n += a[i] != b[i];
    return n;
}

} // namespace

TEST(ErrorInjector, ZeroProbabilityNeverCorrupts) {
    ErrorInjector inj(0.0, 42u);
    auto data = make_payload(512);
    for (int i = 0; i < 10000; ++i) {
        bool corrupted = true;
        EXPECT_EQ(inj.maybe_corrupt(data, &corrupted), data);
        EXPECT_FALSE(corrupted);
    }
    EXPECT_EQ(inj.corruptions(), 0u);
}

TEST(ErrorInjector, FullProbabilityCorruptsExactlyOneByteEveryTime) {
    ErrorInjector inj(1.0, 42u);
    auto data = make_payload(512);
    for (int i = 0; i < 10000; ++i) {
        bool corrupted = false;
        auto out = inj.maybe_corrupt(data, &corrupted);
        ASSERT_TRUE(corrupted);
        ASSERT_EQ(out.size(), data.size());
        ASSERT_EQ(differing_bytes(out, data), 1u);
        for (size_t k = 0; k < out.size(); ++k) {
            if (out[k] != data[k]) EXPECT_EQ(out[k], static_cast<uint8_t>(data[k] + 1));
        }
    }
    EXPECT_EQ(inj.corruptions(), 10000u);
}

TEST(ErrorInjector, NeverTouchesCallerBuffer) {
    ErrorInjector inj(1.0, 3u);
    auto data = make_payload(100);
    const auto copy = data;
    auto out = inj.maybe_corrupt(data);
    EXPECT_EQ(data, copy);
    EXPECT_NE(out, copy);
}

TEST(ErrorInjector, WrapsAroundAtByteMax) {
    ErrorInjector inj(1.0, 9u);
    auto out = inj.maybe_corrupt(std::vector<uint8_t>{ 0xFF });
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], 0x00);
}

TEST(ErrorInjector, SameSeedSameCorruption) {
    auto data = make_payload(512);
    ErrorInjector a(0.5, 1234u);
    ErrorInjector b(0.5, std::mt19937(1234u));
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(a.maybe_corrupt(data), b.maybe_corrupt(data));
    }
}

TEST(ErrorInjector, RateTracksProbability) {
    ErrorInjector inj(0.3, 77u);
    auto data = make_payload(64);
    int hits = 0;
    for (int i = 0; i < 20000; ++i) {
        bool corrupted = false;
        inj.maybe_corrupt(data, &corrupted);
        hits += corrupted;
    }
    EXPECT_NEAR(hits / 20000.0, 0.3, 0.02);
}

TEST(ErrorInjector, EmptyPayloadIsLeftAlone) {
    ErrorInjector inj(1.0, 1u);
    bool corrupted = true;
    EXPECT_TRUE(inj.maybe_corrupt({}, &corrupted).empty());
    EXPECT_FALSE(corrupted);
}

TEST(ErrorInjector, RejectsProbabilityOutsideUnitRange) {
    EXPECT_THROW(ErrorInjector(-0.1, 1u), std::invalid_argument);
    EXPECT_THROW(ErrorInjector(1.5, 1u), std::invalid_argument);
    EXPECT_THROW(ErrorInjector(std::numeric_limits<double>::quiet_NaN(), 1u), std::invalid_argument);
}
