#pragma once

/**
 * @file random.hpp
 * @brief Injectable random source for texture injection and grain.
 */

#include "scrub/types.hpp"
#include <memory>
#include <random>

namespace scrub {

/**
 * @brief Abstract source of uniform random numbers.
 *
 * Every random draw of the pipeline goes through this interface, so a test
 * (or a host wanting reproducible output) can pass a seeded instance and get
 * bit-identical results.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// @brief Uniform value in [0, 1).
    virtual f64 nextUnit() = 0;

    /// @brief Uniform index in [0, n). Returns 0 when n <= 0.
    i32 nextIndex(i32 n) {
        if (n <= 0) return 0;
        i32 i = i32(nextUnit() * n);
        return i < n ? i : n - 1;
    }

    /// @brief Uniform value in [lo, hi).
    f64 uniform(f64 lo, f64 hi) { return lo + (hi - lo) * nextUnit(); }

    /// @brief Create a Mersenne Twister source seeded from std::random_device.
    static std::unique_ptr<RandomSource> MakeDefault();

    /// @brief Create a Mersenne Twister source with a fixed seed.
    static std::unique_ptr<RandomSource> MakeSeeded(u32 seed);
};

/// @brief RandomSource backed by std::mt19937.
class StdRandom : public RandomSource {
public:
    explicit StdRandom(u32 seed) : engine_(seed) {}

    f64 nextUnit() override { return dist_(engine_); }

private:
    std::mt19937 engine_;
    std::uniform_real_distribution<f64> dist_{0.0, 1.0};
};

} // namespace scrub
