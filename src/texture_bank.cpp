#include "scrub/texture_bank.hpp"
#include "scrub/random.hpp"
#include <algorithm>
#include <cstdint>

namespace scrub {

TextureBank TextureBank::Build(const Pixmap& pixmap, const Selection& selection, i32 marginWidth) {
    TextureBank bank;
    if (!pixmap.valid() || selection.isEmpty() || marginWidth <= 0) return bank;

    // ring bounds in 64 bits so any margin clips to the image
    const int64_t margin = marginWidth;
    const i32 minX = i32(std::max<int64_t>(0, selection.x - margin));
    const i32 maxX = i32(std::min<int64_t>(pixmap.width(), int64_t(selection.x) + selection.width + margin));
    const i32 minY = i32(std::max<int64_t>(0, selection.y - margin));
    const i32 maxY = i32(std::min<int64_t>(pixmap.height(), int64_t(selection.y) + selection.height + margin));
    if (maxX <= minX || maxY <= minY) return bank;

    bank.samples_.reserve(size_t(maxX - minX) * size_t(maxY - minY));
    for (i32 y = minY; y < maxY; ++y) {
        for (i32 x = minX; x < maxX; ++x) {
            if (selection.contains(x, y)) continue;
            Color c = pixmap.getPixel(x, y);
            bank.samples_.push_back({c.r, c.g, c.b});
        }
    }
    return bank;
}

TextureSample TextureBank::mean() const {
    if (samples_.empty()) return {};

    u64 sumR = 0, sumG = 0, sumB = 0;
    for (const auto& s : samples_) {
        sumR += s.r;
        sumG += s.g;
        sumB += s.b;
    }
    const u64 n = samples_.size();
    // round half up, matching the fill stage's rounding
    return {u8((sumR * 2 + n) / (n * 2)),
            u8((sumG * 2 + n) / (n * 2)),
            u8((sumB * 2 + n) / (n * 2))};
}

const TextureSample& TextureBank::pick(RandomSource& random) const {
    return samples_[size_t(random.nextIndex(i32(samples_.size())))];
}

} // namespace scrub
