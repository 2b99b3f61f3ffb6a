#include "scrub/distance_field.hpp"
#include <algorithm>

namespace scrub {

DistanceField DistanceField::Make(const Selection& selection) {
    DistanceField field;
    if (selection.isEmpty()) return field;

    field.width_ = selection.width;
    field.height_ = selection.height;
    field.values_.resize(size_t(selection.width) * size_t(selection.height));

    for (i32 ly = 0; ly < field.height_; ++ly) {
        const i32 dy = std::min(ly, field.height_ - 1 - ly);
        for (i32 lx = 0; lx < field.width_; ++lx) {
            const i32 d = std::min(dy, std::min(lx, field.width_ - 1 - lx));
            field.values_[size_t(ly) * size_t(field.width_) + size_t(lx)] = d;
            field.maxDistance_ = std::max(field.maxDistance_, d);
        }
    }
    return field;
}

} // namespace scrub
