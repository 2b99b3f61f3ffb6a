#include "scrub/selection.hpp"
#include <algorithm>

namespace scrub {

namespace {
// Placement of the known bottom-right watermark, measured from the far edges.
constexpr i32 kAutoOffsetX = 200;
constexpr i32 kAutoOffsetY = 80;
constexpr i32 kAutoWidth = 180;
constexpr i32 kAutoHeight = 60;
}

Selection Selection::AutoDetect(i32 imageWidth, i32 imageHeight) {
    Selection s;
    s.x = std::max(0, imageWidth - kAutoOffsetX);
    s.y = std::max(0, imageHeight - kAutoOffsetY);
    s.width = std::min(kAutoWidth, imageWidth);
    s.height = std::min(kAutoHeight, imageHeight);
    return s.clamped(imageWidth, imageHeight);
}

Selection Selection::clamped(i32 imageWidth, i32 imageHeight) const {
    if (isEmpty() || imageWidth <= 0 || imageHeight <= 0) return {};

    // 64-bit edges so huge user rectangles cannot overflow
    i32 x0 = std::max(0, x);
    i32 y0 = std::max(0, y);
    i32 x1 = i32(std::min<int64_t>(imageWidth, int64_t(x) + width));
    i32 y1 = i32(std::min<int64_t>(imageHeight, int64_t(y) + height));

    if (x1 <= x0 || y1 <= y0) return {};
    return {x0, y0, x1 - x0, y1 - y0};
}

Selection resolveSelection(i32 imageWidth, i32 imageHeight,
                           const Selection* userSelection,
                           bool autoDetectEnabled) {
    if (userSelection) return userSelection->clamped(imageWidth, imageHeight);
    if (autoDetectEnabled) return Selection::AutoDetect(imageWidth, imageHeight);
    return {};
}

} // namespace scrub
