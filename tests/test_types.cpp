#include <gtest/gtest.h>
#include <scrub/types.hpp>
#include <scrub/version.hpp>
#include <scrub/stages.hpp>
#include <limits>
#include <string>

using namespace scrub;

// --- Size type aliases ---

TEST(TypeAliases, SizeTypes) {
    static_assert(sizeof(i32) == 4, "i32 must be 4 bytes");
    static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
    static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");
    static_assert(sizeof(u16) == 2, "u16 must be 2 bytes");
    static_assert(sizeof(u8)  == 1, "u8 must be 1 byte");
    static_assert(sizeof(f32) == 4, "f32 must be 4 bytes");
    static_assert(sizeof(f64) == 8, "f64 must be 8 bytes");
}

// --- Color ---

TEST(Color, DefaultIsOpaqueBlack) {
    Color c;
    EXPECT_EQ(c.r, 0);
    EXPECT_EQ(c.g, 0);
    EXPECT_EQ(c.b, 0);
    EXPECT_EQ(c.a, 255);
}

TEST(Color, Equality) {
    Color a{1, 2, 3, 4};
    Color b{1, 2, 3, 4};
    Color c{1, 2, 3, 5};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

// --- Channel rounding ---

TEST(Channel, RoundChannelHalfUp) {
    EXPECT_EQ(roundChannel(0.49), 0);
    EXPECT_EQ(roundChannel(0.5), 1);
    EXPECT_EQ(roundChannel(127.5), 128);
    EXPECT_EQ(roundChannel(-0.4), 0);
    EXPECT_EQ(roundChannel(-3.0), 0);
    EXPECT_EQ(roundChannel(254.6), 255);
    EXPECT_EQ(roundChannel(400.0), 255);
}

TEST(Channel, RoundChannelOutOfRangeAndNaN) {
    EXPECT_EQ(roundChannel(1e12), 255);
    EXPECT_EQ(roundChannel(-1e12), 0);
    EXPECT_EQ(roundChannel(std::numeric_limits<f64>::infinity()), 255);
    EXPECT_EQ(roundChannel(-std::numeric_limits<f64>::infinity()), 0);
    EXPECT_EQ(roundChannel(std::numeric_limits<f64>::quiet_NaN()), 0);
}

// --- Version ---

TEST(Version, MatchesMacros) {
    std::string expected = std::to_string(SCRUB_VERSION_MAJOR) + "." +
                           std::to_string(SCRUB_VERSION_MINOR) + "." +
                           std::to_string(SCRUB_VERSION_PATCH);
    EXPECT_EQ(expected, version());
    EXPECT_EQ(versionMajor(), SCRUB_VERSION_MAJOR);
}
