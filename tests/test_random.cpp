#include <gtest/gtest.h>
#include <scrub/random.hpp>
#include <vector>

using namespace scrub;

namespace {

// Replays a fixed sequence of unit values
class SequenceRandom : public RandomSource {
public:
    explicit SequenceRandom(std::vector<f64> values) : values_(std::move(values)) {}
    f64 nextUnit() override { return values_[next_++ % values_.size()]; }

private:
    std::vector<f64> values_;
    size_t next_ = 0;
};

} // namespace

// --- StdRandom ---

TEST(StdRandom, UnitRange) {
    StdRandom rng(123);
    for (int i = 0; i < 10000; ++i) {
        f64 v = rng.nextUnit();
        ASSERT_GE(v, 0.0);
        ASSERT_LT(v, 1.0);
    }
}

TEST(StdRandom, SameSeedSameSequence) {
    StdRandom a(42), b(42);
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(a.nextUnit(), b.nextUnit());
    }
}

TEST(StdRandom, DifferentSeedsDiffer) {
    StdRandom a(1), b(2);
    int same = 0;
    for (int i = 0; i < 100; ++i) {
        if (a.nextUnit() == b.nextUnit()) ++same;
    }
    EXPECT_LT(same, 100);
}

// --- Helpers on RandomSource ---

TEST(RandomSource, NextIndexStaysInRange) {
    SequenceRandom rng({0.0, 0.5, 0.999999, 1.0});
    EXPECT_EQ(rng.nextIndex(10), 0);
    EXPECT_EQ(rng.nextIndex(10), 5);
    EXPECT_EQ(rng.nextIndex(10), 9);
    // A misbehaving source returning 1.0 still stays in range
    EXPECT_EQ(rng.nextIndex(10), 9);
}

TEST(RandomSource, NextIndexEmptyRange) {
    SequenceRandom rng({0.7});
    EXPECT_EQ(rng.nextIndex(0), 0);
    EXPECT_EQ(rng.nextIndex(-4), 0);
}

TEST(RandomSource, UniformMapsUnitInterval) {
    SequenceRandom rng({0.0, 0.5, 0.75});
    EXPECT_DOUBLE_EQ(rng.uniform(-2.0, 2.0), -2.0);
    EXPECT_DOUBLE_EQ(rng.uniform(-2.0, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(rng.uniform(-2.0, 2.0), 1.0);
}

// --- Factories ---

TEST(RandomSource, MakeSeededIsReproducible) {
    auto a = RandomSource::MakeSeeded(99);
    auto b = RandomSource::MakeSeeded(99);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    for (int i = 0; i < 50; ++i) {
        ASSERT_EQ(a->nextUnit(), b->nextUnit());
    }
}

TEST(RandomSource, MakeDefaultProducesUnitValues) {
    auto rng = RandomSource::MakeDefault();
    ASSERT_NE(rng, nullptr);
    f64 v = rng->nextUnit();
    EXPECT_GE(v, 0.0);
    EXPECT_LT(v, 1.0);
}
