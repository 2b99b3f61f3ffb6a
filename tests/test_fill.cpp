#include <gtest/gtest.h>
#include <scrub/scrub.hpp>
#include <vector>

using namespace scrub;

namespace {

class CancelAfter : public Scheduler {
public:
    explicit CancelAfter(int n) : limit(n) {}
    void yield() override { ++yields; }
    bool cancelRequested() const override { return yields >= limit; }

    int limit;
    int yields = 0;
};

Pixmap makeSolid(i32 w, i32 h, Color c) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(w, h));
    pm.clear(c);
    return pm;
}

} // namespace

// --- fillWithMean ---

TEST(FillWithMean, PaintsSelectionOnly) {
    auto pm = makeSolid(8, 8, {10, 10, 10, 200});
    Selection sel{2, 3, 4, 2};
    fillWithMean(pm, sel, {90, 80, 70});

    for (i32 y = 0; y < 8; ++y) {
        for (i32 x = 0; x < 8; ++x) {
            Color c = pm.getPixel(x, y);
            if (sel.contains(x, y)) {
                EXPECT_EQ(c, (Color{90, 80, 70, 200})) << x << "," << y;
            } else {
                EXPECT_EQ(c, (Color{10, 10, 10, 200})) << x << "," << y;
            }
        }
    }
}

// --- progressiveFill ---

TEST(ProgressiveFill, UniformSurroundingsFillUniformly) {
    const Color bg{40, 120, 200, 255};
    auto pm = makeSolid(30, 30, bg);
    Selection sel{8, 8, 12, 10};
    auto bank = TextureBank::Build(pm, sel, 5);
    auto original = Image::MakeFromPixmap(pm);
    ASSERT_NE(original, nullptr);
    fillWithMean(pm, sel, {0, 0, 0});

    ProcessingOptions opts;
    opts.marginWidth = 5;
    StdRandom rng(1);
    Checkpoint cp;
    auto field = DistanceField::Make(sel);
    ASSERT_TRUE(progressiveFill(pm, *original, sel, field, bank, opts, rng, cp));

    for (i32 y = sel.y; y < sel.y + sel.height; ++y) {
        for (i32 x = sel.x; x < sel.x + sel.width; ++x) {
            EXPECT_EQ(pm.getPixel(x, y), bg) << x << "," << y;
        }
    }
}

TEST(ProgressiveFill, NeverReadsUnfinishedLayers) {
    // Exterior black, interior preset to white. Every layer may only see
    // the exterior and earlier layers, so nothing white can leak through.
    auto pm = makeSolid(20, 20, {0, 0, 0, 255});
    Selection sel{5, 5, 9, 9};
    auto original = Image::MakeFromPixmap(pm);
    ASSERT_NE(original, nullptr);
    fillWithMean(pm, sel, {255, 255, 255});

    TextureBank emptyBank;
    ProcessingOptions opts;
    StdRandom rng(1);
    Checkpoint cp;
    auto field = DistanceField::Make(sel);
    ASSERT_TRUE(progressiveFill(pm, *original, sel, field, emptyBank, opts, rng, cp));

    for (i32 y = sel.y; y < sel.y + sel.height; ++y) {
        for (i32 x = sel.x; x < sel.x + sel.width; ++x) {
            EXPECT_EQ(pm.getPixel(x, y), (Color{0, 0, 0, 255})) << x << "," << y;
        }
    }
}

TEST(ProgressiveFill, ReadsExteriorFromSnapshot) {
    auto pm = makeSolid(20, 20, {60, 60, 60, 255});
    Selection sel{6, 6, 6, 6};
    auto original = Image::MakeFromPixmap(pm);
    ASSERT_NE(original, nullptr);

    // Scribble over the live exterior; the fill must ignore it
    for (i32 x = 0; x < 20; ++x) pm.setRGB(x, 5, 255, 0, 0);
    fillWithMean(pm, sel, {0, 0, 0});

    TextureBank emptyBank;
    ProcessingOptions opts;
    StdRandom rng(1);
    Checkpoint cp;
    auto field = DistanceField::Make(sel);
    ASSERT_TRUE(progressiveFill(pm, *original, sel, field, emptyBank, opts, rng, cp));
    EXPECT_EQ(pm.getPixel(8, 6), (Color{60, 60, 60, 255}));
}

TEST(ProgressiveFill, NoNeighborsLeavesPixelUnchanged) {
    // Whole-image selection with no texture: layer 0 has nothing to read
    auto pm = makeSolid(6, 6, {0, 0, 0, 255});
    Selection sel{0, 0, 6, 6};
    auto original = Image::MakeFromPixmap(pm);
    fillWithMean(pm, sel, {33, 44, 55});

    TextureBank emptyBank;
    ProcessingOptions opts;
    StdRandom rng(1);
    Checkpoint cp;
    auto field = DistanceField::Make(sel);
    ASSERT_TRUE(progressiveFill(pm, *original, sel, field, emptyBank, opts, rng, cp));
    EXPECT_EQ(pm.getPixel(0, 0), (Color{33, 44, 55, 255}));
}

TEST(ProgressiveFill, PreservesAlphaAndExterior) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(16, 16));
    for (i32 y = 0; y < 16; ++y)
        for (i32 x = 0; x < 16; ++x)
            pm.setPixel(x, y, {u8(x * 10), u8(y * 10), 5, u8(100 + x)});
    Selection sel{4, 4, 6, 5};
    auto bank = TextureBank::Build(pm, sel, 3);
    auto original = Image::MakeFromPixmap(pm);
    fillWithMean(pm, sel, bank.mean());

    ProcessingOptions opts;
    opts.marginWidth = 3;
    StdRandom rng(9);
    Checkpoint cp;
    auto field = DistanceField::Make(sel);
    ASSERT_TRUE(progressiveFill(pm, *original, sel, field, bank, opts, rng, cp));

    for (i32 y = 0; y < 16; ++y) {
        for (i32 x = 0; x < 16; ++x) {
            Color c = pm.getPixel(x, y);
            EXPECT_EQ(c.a, u8(100 + x));
            if (!sel.contains(x, y)) EXPECT_EQ(c, original->getPixel(x, y));
        }
    }
}

TEST(ProgressiveFill, ProgressSpansTwentyToSeventy) {
    auto pm = makeSolid(40, 40, {1, 2, 3, 255});
    Selection sel{5, 5, 20, 14};  // max layer 6
    auto bank = TextureBank::Build(pm, sel, 4);
    auto original = Image::MakeFromPixmap(pm);

    std::vector<f32> seen;
    Checkpoint cp([&](f32 p) { seen.push_back(p); }, nullptr);
    ProcessingOptions opts;
    StdRandom rng(2);
    auto field = DistanceField::Make(sel);
    ASSERT_TRUE(progressiveFill(pm, *original, sel, field, bank, opts, rng, cp));

    ASSERT_EQ(seen.size(), 7u);
    EXPECT_FLOAT_EQ(seen.front(), 20.0f);
    EXPECT_FLOAT_EQ(seen.back(), 70.0f);
    // Layers 0, 3 and 6 yield
    EXPECT_EQ(cp.yieldCount(), 3);
}

TEST(ProgressiveFill, SingleLayerReportsSeventy) {
    auto pm = makeSolid(10, 10, {1, 2, 3, 255});
    Selection sel{2, 4, 6, 2};
    auto bank = TextureBank::Build(pm, sel, 2);
    auto original = Image::MakeFromPixmap(pm);

    std::vector<f32> seen;
    Checkpoint cp([&](f32 p) { seen.push_back(p); }, nullptr);
    ProcessingOptions opts;
    StdRandom rng(2);
    auto field = DistanceField::Make(sel);
    ASSERT_TRUE(progressiveFill(pm, *original, sel, field, bank, opts, rng, cp));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_FLOAT_EQ(seen[0], 70.0f);
}

TEST(ProgressiveFill, StopsWhenCancelled) {
    auto pm = makeSolid(40, 40, {1, 2, 3, 255});
    Selection sel{5, 5, 20, 20};
    auto bank = TextureBank::Build(pm, sel, 4);
    auto original = Image::MakeFromPixmap(pm);

    CancelAfter sched(1);
    Checkpoint cp(nullptr, &sched);
    ProcessingOptions opts;
    StdRandom rng(2);
    auto field = DistanceField::Make(sel);
    EXPECT_FALSE(progressiveFill(pm, *original, sel, field, bank, opts, rng, cp));
    EXPECT_EQ(sched.yields, 1);
}
