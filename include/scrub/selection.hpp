#pragma once

/**
 * @file selection.hpp
 * @brief Target rectangle for inpainting, clamping and the auto-detect heuristic.
 */

#include "scrub/types.hpp"

namespace scrub {

/// @brief Rectangle to erase and refill, in integer pixel coordinates.
///
/// Membership is half-open: a pixel (px, py) is inside when
/// x <= px < x + width and y <= py < y + height.
struct Selection {
    i32 x = 0;       ///< Left edge.
    i32 y = 0;       ///< Top edge.
    i32 width = 0;   ///< Width in pixels.
    i32 height = 0;  ///< Height in pixels.

    /// @brief Fixed positional guess for a bottom-right watermark.
    ///
    /// No image analysis is performed: x = max(0, w - 200), y = max(0, h - 80),
    /// width = min(180, w), height = min(60, h), then clamped to the image.
    /// @param imageWidth Image width in pixels.
    /// @param imageHeight Image height in pixels.
    /// @return The clamped selection.
    static Selection AutoDetect(i32 imageWidth, i32 imageHeight);

    /// @brief Intersect this rectangle with the image bounds.
    /// @return The clamped rectangle; zero-sized when nothing overlaps.
    Selection clamped(i32 imageWidth, i32 imageHeight) const;

    /// @brief True when the rectangle has no area (degenerate).
    bool isEmpty() const { return width <= 0 || height <= 0; }

    /// @brief True when the rectangle is non-empty and lies inside the image.
    bool fitsWithin(i32 imageWidth, i32 imageHeight) const {
        return !isEmpty() && x >= 0 && y >= 0 &&
               x + width <= imageWidth && y + height <= imageHeight;
    }

    /// @brief Half-open membership test.
    bool contains(i32 px, i32 py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    bool operator==(const Selection& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Selection& o) const { return !(*this == o); }
};

/// @brief Pick the selection for an image.
///
/// Uses @p userSelection when given, otherwise the auto-detect guess when
/// @p autoDetectEnabled is set, otherwise an empty selection. The result is
/// always clamped to the image, so a degenerate result means "nothing to do".
Selection resolveSelection(i32 imageWidth, i32 imageHeight,
                           const Selection* userSelection,
                           bool autoDetectEnabled);

} // namespace scrub
