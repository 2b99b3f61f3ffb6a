#include <gtest/gtest.h>
#include <scrub/selection.hpp>
#include <climits>

using namespace scrub;

// --- AutoDetect ---

TEST(Selection, AutoDetectBottomRight) {
    EXPECT_EQ(Selection::AutoDetect(400, 300), (Selection{200, 220, 180, 60}));
    EXPECT_EQ(Selection::AutoDetect(1920, 1080), (Selection{1720, 1000, 180, 60}));
}

TEST(Selection, AutoDetectSmallImageCoversWholeImage) {
    EXPECT_EQ(Selection::AutoDetect(150, 50), (Selection{0, 0, 150, 50}));
    EXPECT_EQ(Selection::AutoDetect(1, 1), (Selection{0, 0, 1, 1}));
}

TEST(Selection, AutoDetectNarrowOrShortImage) {
    EXPECT_EQ(Selection::AutoDetect(190, 100), (Selection{0, 20, 180, 60}));
    EXPECT_EQ(Selection::AutoDetect(250, 70), (Selection{50, 0, 180, 60}));
}

TEST(Selection, AutoDetectAlwaysFits) {
    for (i32 w = 1; w < 420; w += 37) {
        for (i32 h = 1; h < 200; h += 23) {
            Selection s = Selection::AutoDetect(w, h);
            EXPECT_TRUE(s.fitsWithin(w, h)) << w << "x" << h;
        }
    }
}

TEST(Selection, AutoDetectEmptyImage) {
    EXPECT_TRUE(Selection::AutoDetect(0, 300).isEmpty());
    EXPECT_TRUE(Selection::AutoDetect(400, 0).isEmpty());
}

// --- clamped ---

TEST(Selection, ClampedInsideIsUnchanged) {
    Selection s{10, 20, 30, 40};
    EXPECT_EQ(s.clamped(100, 100), s);
}

TEST(Selection, ClampedIntersectsWithImage) {
    EXPECT_EQ((Selection{-5, -10, 20, 30}).clamped(100, 100), (Selection{0, 0, 15, 20}));
    EXPECT_EQ((Selection{90, 95, 50, 50}).clamped(100, 100), (Selection{90, 95, 10, 5}));
}

TEST(Selection, ClampedOutsideIsEmpty) {
    EXPECT_TRUE((Selection{200, 10, 20, 20}).clamped(100, 100).isEmpty());
    EXPECT_TRUE((Selection{-50, 10, 20, 20}).clamped(100, 100).isEmpty());
}

TEST(Selection, ClampedDegenerateIsEmpty) {
    EXPECT_TRUE((Selection{10, 10, 0, 20}).clamped(100, 100).isEmpty());
    EXPECT_TRUE((Selection{10, 10, 20, -4}).clamped(100, 100).isEmpty());
}

TEST(Selection, ClampedHugeRectangleDoesNotOverflow) {
    Selection s{10, 10, INT_MAX, INT_MAX};
    EXPECT_EQ(s.clamped(100, 50), (Selection{10, 10, 90, 40}));
}

// --- Membership ---

TEST(Selection, ContainsIsHalfOpen) {
    Selection s{2, 3, 4, 5};
    EXPECT_TRUE(s.contains(2, 3));
    EXPECT_TRUE(s.contains(5, 7));
    EXPECT_FALSE(s.contains(6, 3));
    EXPECT_FALSE(s.contains(2, 8));
    EXPECT_FALSE(s.contains(1, 3));
}

// --- resolveSelection ---

TEST(ResolveSelection, UserSelectionWins) {
    Selection user{5, 5, 10, 10};
    EXPECT_EQ(resolveSelection(400, 300, &user, true), user);
}

TEST(ResolveSelection, UserSelectionIsClamped) {
    Selection user{390, 290, 50, 50};
    EXPECT_EQ(resolveSelection(400, 300, &user, false), (Selection{390, 290, 10, 10}));
}

TEST(ResolveSelection, FallsBackToAutoDetect) {
    EXPECT_EQ(resolveSelection(400, 300, nullptr, true), (Selection{200, 220, 180, 60}));
}

TEST(ResolveSelection, NothingWithoutAutoDetect) {
    EXPECT_TRUE(resolveSelection(400, 300, nullptr, false).isEmpty());
}
