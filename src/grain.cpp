#include "scrub/stages.hpp"
#include "scrub/random.hpp"
#include <algorithm>

namespace scrub {

void addGrain(Pixmap& target, const Selection& selection, f32 strength,
              RandomSource& random) {
    if (!(strength > 0.0f)) return;
    // beyond one full channel range every draw saturates anyway
    const f64 s = std::min(f64(strength), 255.0);

    for (i32 y = selection.y; y < selection.y + selection.height; ++y) {
        for (i32 x = selection.x; x < selection.x + selection.width; ++x) {
            const Color c = target.getPixel(x, y);
            const f64 nr = random.uniform(-s, s);
            const f64 ng = random.uniform(-s, s);
            const f64 nb = random.uniform(-s, s);
            target.setRGB(x, y,
                          roundChannel(c.r + nr),
                          roundChannel(c.g + ng),
                          roundChannel(c.b + nb));
        }
    }
}

} // namespace scrub
