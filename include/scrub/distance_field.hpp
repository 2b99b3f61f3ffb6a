#pragma once

/**
 * @file distance_field.hpp
 * @brief Per-pixel distance to the nearest selection edge.
 */

#include "scrub/types.hpp"
#include "scrub/selection.hpp"
#include <cstddef>
#include <vector>

namespace scrub {

/**
 * @brief Integer distance from each selection pixel to the selection boundary.
 *
 * For local coordinates (lx, ly) the value is
 * min(lx, width - 1 - lx, ly, height - 1 - ly). Edge pixels are 0. The value
 * groups pixels into fill layers and picks the feathering band.
 */
class DistanceField {
public:
    DistanceField() = default;

    /// @brief Build the field for a non-degenerate selection.
    static DistanceField Make(const Selection& selection);

    i32 width() const { return width_; }
    i32 height() const { return height_; }

    /// @brief Distance at local coordinates; no bounds checking.
    i32 at(i32 lx, i32 ly) const { return values_[size_t(ly) * size_t(width_) + size_t(lx)]; }

    /// @brief Largest distance in the field (the last fill layer).
    i32 maxDistance() const { return maxDistance_; }

    bool empty() const { return values_.empty(); }

private:
    i32 width_ = 0;
    i32 height_ = 0;
    i32 maxDistance_ = 0;
    std::vector<i32> values_;
};

} // namespace scrub
