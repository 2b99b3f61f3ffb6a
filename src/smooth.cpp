#include "scrub/stages.hpp"
#include <algorithm>
#include <cstdio>
#include <memory>

namespace scrub {

namespace {
constexpr f32 kSmoothProgressStart = 75.0f;
constexpr f32 kSmoothProgressSpan = 15.0f;
}

bool smoothSelection(Pixmap& target, const Selection& selection,
                     i32 passCount, i32 radius, Checkpoint& checkpoint) {
    const i32 W = target.width();
    const i32 H = target.height();

    for (i32 pass = 0; pass < passCount; ++pass) {
        std::shared_ptr<Image> previous = Image::MakeFromPixmap(target);
        if (!previous) {
            std::fprintf(stderr, "scrub Smooth: snapshot allocation failed, skipping remaining passes\n");
            return true;
        }

        for (i32 y = selection.y; y < selection.y + selection.height; ++y) {
            const i32 y0 = std::max(0, y - radius);
            const i32 y1 = std::min(H - 1, y + radius);
            for (i32 x = selection.x; x < selection.x + selection.width; ++x) {
                const i32 x0 = std::max(0, x - radius);
                const i32 x1 = std::min(W - 1, x + radius);

                u32 sumR = 0, sumG = 0, sumB = 0;
                u32 count = 0;
                for (i32 sy = y0; sy <= y1; ++sy) {
                    for (i32 sx = x0; sx <= x1; ++sx) {
                        Color c = previous->getPixel(sx, sy);
                        sumR += c.r;
                        sumG += c.g;
                        sumB += c.b;
                        ++count;
                    }
                }

                // count >= 1: the center pixel is always in the window
                target.setRGB(x, y,
                              roundChannel(f64(sumR) / count),
                              roundChannel(f64(sumG) / count),
                              roundChannel(f64(sumB) / count));
            }
        }

        checkpoint.report(kSmoothProgressStart + f32(pass + 1) / f32(passCount) * kSmoothProgressSpan);
        if (!checkpoint.yield()) return false;
    }
    return true;
}

} // namespace scrub
