/**
 * example_basic.cpp - Erase a synthetic watermark with scrub
 *
 * Demonstrates:
 *   - Allocating an RGBA Pixmap and painting a test scene into it
 *   - Auto-detecting the bottom-right watermark rectangle
 *   - Running the inpainter with a seeded random source and a progress callback
 *   - Writing before/after PPM files for viewing
 *
 * Build:
 *   cmake -B build -DSCRUB_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_basic
 *
 * Output: basic_before.ppm, basic_after.ppm
 */

#include <scrub/scrub.hpp>
#include <cstdio>

// Soft vertical gradient with a little sensor-like noise
static void paintScene(scrub::Pixmap& pm, scrub::RandomSource& rng) {
    using scrub::u8;
    const int W = pm.width(), H = pm.height();
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            double t = double(y) / H;
            double n = rng.uniform(-6.0, 6.0);
            u8 r = scrub::roundChannel(70 + 90 * t + n);
            u8 g = scrub::roundChannel(110 + 60 * t + n);
            u8 b = scrub::roundChannel(170 - 40 * t + n);
            pm.setPixel(x, y, {r, g, b, 255});
        }
    }
}

// Bright striped block standing in for a logo overlay
static void paintWatermark(scrub::Pixmap& pm, const scrub::Selection& s) {
    for (int y = s.y + 8; y < s.y + s.height - 8; ++y) {
        for (int x = s.x + 10; x < s.x + s.width - 10; ++x) {
            if ((x / 6 + y / 6) % 2 == 0) pm.setRGB(x, y, 245, 245, 245);
        }
    }
}

int main() {
    const int W = 400, H = 300;

    scrub::Pixmap pm = scrub::Pixmap::Alloc(scrub::PixmapInfo::MakeRGBA(W, H));
    if (!pm.valid()) {
        std::printf("Failed to allocate %dx%d pixmap\n", W, H);
        return 1;
    }

    scrub::StdRandom sceneRng(1234);
    paintScene(pm, sceneRng);

    scrub::Selection sel = scrub::Selection::AutoDetect(W, H);
    paintWatermark(pm, sel);
    scrub::encodePpm(pm, "basic_before.ppm");
    std::printf("Selection: %d,%d %dx%d\n", sel.x, sel.y, sel.width, sel.height);

    scrub::ProcessingOptions options;
    options.marginWidth = 30;

    scrub::StdRandom rng(7);
    scrub::InpaintContext ctx;
    ctx.random = &rng;
    ctx.progress = [](scrub::f32 p) { std::printf("\rProgress: %5.1f%%", p); };

    scrub::InpaintStatus status = scrub::inpaint(pm, sel, options, ctx);
    std::printf("\nStatus: %s\n", scrub::toString(status));

    if (!scrub::encodePpm(pm, "basic_after.ppm")) {
        std::printf("Failed to write basic_after.ppm\n");
        return 1;
    }
    std::printf("Written: basic_before.ppm, basic_after.ppm (%dx%d)\n", W, H);
    return 0;
}
