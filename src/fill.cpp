#include "scrub/stages.hpp"
#include "scrub/random.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace scrub {

namespace {

constexpr f64 kFalloff = 0.3;

// Progress sub-range owned by the fill layers
constexpr f32 kFillProgressStart = 20.0f;
constexpr f32 kFillProgressSpan = 50.0f;

struct NeighborTap {
    i32 dx;
    i32 dy;
    f64 weight;
};

// Disk of offsets within radius, excluding the center, in row-major order
std::vector<NeighborTap> makeTaps(i32 radius) {
    std::vector<NeighborTap> taps;
    for (i32 dy = -radius; dy <= radius; ++dy) {
        for (i32 dx = -radius; dx <= radius; ++dx) {
            if (dx == 0 && dy == 0) continue;
            const f64 d = std::sqrt(f64(dx * dx + dy * dy));
            if (d > radius) continue;
            taps.push_back({dx, dy, 1.0 / (1.0 + d * kFalloff)});
        }
    }
    return taps;
}

} // namespace

u8 roundChannel(f64 v) {
    // clamp before converting; NaN fails the first test and maps to 0
    if (!(v > 0.0)) return 0;
    if (v >= 255.0) return 255;
    return u8(std::floor(v + 0.5));
}

void fillWithMean(Pixmap& target, const Selection& selection, TextureSample color) {
    for (i32 y = selection.y; y < selection.y + selection.height; ++y) {
        for (i32 x = selection.x; x < selection.x + selection.width; ++x) {
            target.setRGB(x, y, color.r, color.g, color.b);
        }
    }
}

bool progressiveFill(Pixmap& target, const Image& original,
                     const Selection& selection, const DistanceField& field,
                     const TextureBank& bank, const ProcessingOptions& options,
                     RandomSource& random, Checkpoint& checkpoint) {
    const i32 W = target.width();
    const i32 H = target.height();
    const i32 radius = std::min(options.sampleRadiusCap, options.marginWidth);
    const std::vector<NeighborTap> taps = makeTaps(radius);
    const i32 maxLayer = field.maxDistance();
    const i32 yieldEvery = std::max(1, options.yieldEveryLayers);

    for (i32 layer = 0; layer <= maxLayer; ++layer) {
        for (i32 ly = 0; ly < selection.height; ++ly) {
            for (i32 lx = 0; lx < selection.width; ++lx) {
                if (field.at(lx, ly) != layer) continue;

                const i32 x = selection.x + lx;
                const i32 y = selection.y + ly;

                f64 sumR = 0, sumG = 0, sumB = 0;
                f64 totalWeight = 0;

                for (const NeighborTap& t : taps) {
                    const i32 sx = x + t.dx;
                    const i32 sy = y + t.dy;
                    if (sx < 0 || sx >= W || sy < 0 || sy >= H) continue;

                    Color c;
                    if (selection.contains(sx, sy)) {
                        // Only layers already finished may be read
                        if (field.at(sx - selection.x, sy - selection.y) >= layer) continue;
                        c = target.getPixel(sx, sy);
                    } else {
                        c = original.getPixel(sx, sy);
                    }
                    sumR += c.r * t.weight;
                    sumG += c.g * t.weight;
                    sumB += c.b * t.weight;
                    totalWeight += t.weight;
                }

                if (!bank.empty()) {
                    for (i32 i = 0; i < options.textureSamplesPerPixel; ++i) {
                        const TextureSample& s = bank.pick(random);
                        const f64 w = options.textureSampleWeight;
                        sumR += s.r * w;
                        sumG += s.g * w;
                        sumB += s.b * w;
                        totalWeight += w;
                    }
                }

                if (totalWeight > 0) {
                    target.setRGB(x, y,
                                  roundChannel(sumR / totalWeight),
                                  roundChannel(sumG / totalWeight),
                                  roundChannel(sumB / totalWeight));
                }
            }
        }

        if (maxLayer > 0) {
            checkpoint.report(kFillProgressStart + f32(layer) / f32(maxLayer) * kFillProgressSpan);
        } else {
            checkpoint.report(kFillProgressStart + kFillProgressSpan);
        }

        if (layer % yieldEvery == 0 && !checkpoint.yield()) {
            return false;
        }
    }
    return true;
}

} // namespace scrub
