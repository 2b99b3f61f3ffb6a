#include <gtest/gtest.h>
#include <scrub/scrub.hpp>
#include <cstdlib>
#include <limits>
#include <vector>

using namespace scrub;

namespace {

class SequenceRandom : public RandomSource {
public:
    explicit SequenceRandom(std::vector<f64> values) : values_(std::move(values)) {}
    f64 nextUnit() override {
        ++draws;
        return values_[next_++ % values_.size()];
    }

    int draws = 0;

private:
    std::vector<f64> values_;
    size_t next_ = 0;
};

} // namespace

TEST(Grain, ZeroStrengthIsNoOp) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(4, 4));
    pm.clear({128, 128, 128, 255});
    SequenceRandom rng({0.9});
    addGrain(pm, {0, 0, 4, 4}, 0.0f, rng);
    EXPECT_EQ(pm.getPixel(2, 2), (Color{128, 128, 128, 255}));
    EXPECT_EQ(rng.draws, 0);
}

TEST(Grain, ChannelsGetIndependentNoise) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(1, 1));
    pm.clear({128, 128, 128, 255});
    // Maps to -2, 0 and +1.8 for strength 2
    SequenceRandom rng({0.0, 0.5, 0.95});
    addGrain(pm, {0, 0, 1, 1}, 2.0f, rng);
    EXPECT_EQ(pm.getPixel(0, 0), (Color{126, 128, 130, 255}));
    EXPECT_EQ(rng.draws, 3);
}

TEST(Grain, BoundedByStrength) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(32, 32));
    pm.clear({100, 150, 200, 255});
    StdRandom rng(11);
    addGrain(pm, {0, 0, 32, 32}, 2.0f, rng);
    for (i32 y = 0; y < 32; ++y) {
        for (i32 x = 0; x < 32; ++x) {
            Color c = pm.getPixel(x, y);
            EXPECT_LE(std::abs(int(c.r) - 100), 2);
            EXPECT_LE(std::abs(int(c.g) - 150), 2);
            EXPECT_LE(std::abs(int(c.b) - 200), 2);
        }
    }
}

TEST(Grain, ClampsToChannelRange) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(2, 1));
    pm.setPixel(0, 0, {0, 0, 0, 255});
    pm.setPixel(1, 0, {255, 255, 255, 255});
    SequenceRandom rng({0.0, 0.0, 0.0, 0.999, 0.999, 0.999});
    addGrain(pm, {0, 0, 2, 1}, 10.0f, rng);
    EXPECT_EQ(pm.getPixel(0, 0), (Color{0, 0, 0, 255}));
    EXPECT_EQ(pm.getPixel(1, 0), (Color{255, 255, 255, 255}));
}

TEST(Grain, HugeStrengthSaturates) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(1, 1));
    pm.clear({128, 128, 128, 255});
    SequenceRandom rng({0.0, 0.999, 0.5});
    addGrain(pm, {0, 0, 1, 1}, 1e10f, rng);
    EXPECT_EQ(pm.getPixel(0, 0), (Color{0, 255, 128, 255}));
}

TEST(Grain, InfiniteStrengthStaysInRange) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(16, 16));
    pm.clear({128, 128, 128, 255});
    StdRandom rng(5);
    addGrain(pm, {0, 0, 16, 16}, std::numeric_limits<f32>::infinity(), rng);
    int dark = 0, bright = 0;
    for (i32 y = 0; y < 16; ++y) {
        for (i32 x = 0; x < 16; ++x) {
            Color c = pm.getPixel(x, y);
            EXPECT_EQ(c.a, 255);
            dark += c.r == 0;
            bright += c.r == 255;
        }
    }
    // noise spans the whole channel range instead of collapsing to black
    EXPECT_GT(dark, 0);
    EXPECT_GT(bright, 0);
}

TEST(Grain, OnlyTouchesSelectionColor) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(8, 8));
    pm.clear({128, 128, 128, 77});
    StdRandom rng(3);
    Selection sel{2, 2, 3, 3};
    addGrain(pm, sel, 50.0f, rng);
    for (i32 y = 0; y < 8; ++y) {
        for (i32 x = 0; x < 8; ++x) {
            Color c = pm.getPixel(x, y);
            EXPECT_EQ(c.a, 77);
            if (!sel.contains(x, y)) EXPECT_EQ(c, (Color{128, 128, 128, 77}));
        }
    }
}
