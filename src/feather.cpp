#include "scrub/stages.hpp"
#include <cmath>
#include <limits>

namespace scrub {

void featherEdges(Pixmap& target, const Image& original,
                  const Selection& selection, const DistanceField& field,
                  i32 featherWidth) {
    if (featherWidth <= 0) return;

    const i32 W = target.width();
    const i32 H = target.height();

    for (i32 ly = 0; ly < selection.height; ++ly) {
        for (i32 lx = 0; lx < selection.width; ++lx) {
            const i32 distToEdge = field.at(lx, ly);
            if (distToEdge >= featherWidth) continue;

            const i32 x = selection.x + lx;
            const i32 y = selection.y + ly;

            bool found = false;
            Color nearest;
            f64 minDist = std::numeric_limits<f64>::infinity();

            for (i32 dy = -featherWidth; dy <= featherWidth; ++dy) {
                for (i32 dx = -featherWidth; dx <= featherWidth; ++dx) {
                    const i32 sx = x + dx;
                    const i32 sy = y + dy;
                    if (sx < 0 || sx >= W || sy < 0 || sy >= H) continue;
                    if (selection.contains(sx, sy)) continue;

                    const f64 d = std::sqrt(f64(dx * dx + dy * dy));
                    if (d < minDist) {
                        minDist = d;
                        nearest = original.getPixel(sx, sy);
                        found = true;
                    }
                }
            }
            // Edge flush with the image border: nothing exterior to blend toward
            if (!found) continue;

            const f64 blend = f64(distToEdge) / f64(featherWidth);
            const Color cur = target.getPixel(x, y);
            target.setRGB(x, y,
                          roundChannel(cur.r * blend + nearest.r * (1.0 - blend)),
                          roundChannel(cur.g * blend + nearest.g * (1.0 - blend)),
                          roundChannel(cur.b * blend + nearest.b * (1.0 - blend)));
        }
    }
}

} // namespace scrub
