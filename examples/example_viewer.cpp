/**
 * example_viewer.cpp - Interactive watermark eraser, displayed via SDL2
 *
 * Demonstrates:
 *   - Driving the pipeline's cooperative checkpoints from an SDL event loop
 *   - Cancelling a running inpaint (ESC while processing)
 *   - Choosing the region with the mouse, or the auto-detect guess (A)
 *
 * Controls:
 *   drag        select a rectangle and erase it
 *   A           erase the auto-detected bottom-right rectangle
 *   SPACE       toggle before/after
 *   S           save the current result to viewer_out.pam
 *   ESC         cancel processing, or quit when idle
 *
 * Build:
 *   cmake -B build -DSCRUB_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_viewer [image.ppm|image.pam]
 */

#include <scrub/scrub.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include <SDL2/SDL.h>

// Pumps SDL events at every pipeline checkpoint so the window stays responsive
class SdlScheduler : public scrub::Scheduler {
public:
    void yield() override {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) { cancel_ = true; quit_ = true; }
            if (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE) cancel_ = true;
        }
    }

    bool cancelRequested() const override { return cancel_; }
    bool quitRequested() const { return quit_; }
    void reset() { cancel_ = false; }

private:
    bool cancel_ = false;
    bool quit_ = false;
};

static scrub::Pixmap makeDemoImage(int W, int H) {
    scrub::Pixmap pm = scrub::Pixmap::Alloc(scrub::PixmapInfo::MakeRGBA(W, H));
    if (!pm.valid()) return pm;
    scrub::StdRandom rng(99);
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            double n = rng.uniform(-5.0, 5.0);
            pm.setPixel(x, y, {scrub::roundChannel(60 + 120.0 * x / W + n),
                               scrub::roundChannel(90 + 80.0 * y / H + n),
                               scrub::roundChannel(150 + n), 255});
        }
    }
    scrub::Selection wm = scrub::Selection::AutoDetect(W, H);
    for (int y = wm.y + 10; y < wm.y + wm.height - 10; ++y)
        for (int x = wm.x + 12; x < wm.x + wm.width - 12; ++x)
            if ((x / 5) % 3 != 0) pm.setRGB(x, y, 250, 250, 250);
    return pm;
}

static void copyPixmap(const scrub::Pixmap& src, scrub::Pixmap& dst) {
    dst = scrub::Pixmap::Alloc(src.info());
    if (dst.valid()) std::memcpy(dst.addr(), src.addr(), src.info().computeByteSize());
}

int main(int argc, char* argv[]) {
    scrub::Pixmap original = argc > 1 ? scrub::decodeNetpbm(argv[1]) : makeDemoImage(640, 400);
    if (!original.valid()) {
        std::printf("No image to show\n");
        return 1;
    }
    const int W = original.width(), H = original.height();

    scrub::Pixmap result;
    copyPixmap(original, result);

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::printf("SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "scrub - viewer",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        W, H,
        SDL_WINDOW_SHOWN
    );
    if (!window) {
        std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::printf("SDL_CreateRenderer failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    // RGBA32 is R,G,B,A in memory regardless of endianness, matching Pixmap
    SDL_Texture* texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_RGBA32,
        SDL_TEXTUREACCESS_STREAMING,
        W, H
    );
    if (!texture) {
        std::printf("SDL_CreateTexture failed: %s\n", SDL_GetError());
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    SdlScheduler scheduler;
    bool running = true;
    bool showOriginal = false;
    bool dragging = false;
    int dragX = 0, dragY = 0, curX = 0, curY = 0;

    auto runInpaint = [&](const scrub::Selection& sel) {
        scheduler.reset();
        scrub::InpaintContext ctx;
        ctx.scheduler = &scheduler;
        ctx.progress = [window](scrub::f32 p) {
            char title[64];
            std::snprintf(title, sizeof(title), "scrub - processing %3d%%", int(p));
            SDL_SetWindowTitle(window, title);
        };
        scrub::InpaintStatus status = scrub::inpaint(result, sel, {}, ctx);
        std::printf("Region %d,%d %dx%d: %s\n", sel.x, sel.y, sel.width, sel.height,
                    scrub::toString(status));
        SDL_SetWindowTitle(window, "scrub - viewer");
        if (scheduler.quitRequested()) running = false;
    };

    std::printf("Drag to erase, A = auto-detect, SPACE = before/after, S = save, ESC = quit\n");

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
            case SDL_QUIT:
                running = false;
                break;
            case SDL_KEYDOWN:
                if (event.key.keysym.sym == SDLK_ESCAPE) running = false;
                if (event.key.keysym.sym == SDLK_SPACE) showOriginal = !showOriginal;
                if (event.key.keysym.sym == SDLK_a) runInpaint(scrub::Selection::AutoDetect(W, H));
                if (event.key.keysym.sym == SDLK_s) {
                    if (scrub::encodePam(result, "viewer_out.pam")) std::printf("Saved viewer_out.pam\n");
                }
                break;
            case SDL_MOUSEBUTTONDOWN:
                dragging = true;
                dragX = curX = event.button.x;
                dragY = curY = event.button.y;
                break;
            case SDL_MOUSEMOTION:
                curX = event.motion.x;
                curY = event.motion.y;
                break;
            case SDL_MOUSEBUTTONUP:
                if (dragging) {
                    dragging = false;
                    scrub::Selection sel{std::min(dragX, curX), std::min(dragY, curY),
                                         std::abs(curX - dragX), std::abs(curY - dragY)};
                    runInpaint(sel);
                }
                break;
            default:
                break;
            }
        }

        const scrub::Pixmap& shown = showOriginal ? original : result;
        SDL_UpdateTexture(texture, nullptr, shown.addr(), shown.stride());
        SDL_RenderClear(renderer);
        SDL_RenderCopy(renderer, texture, nullptr, nullptr);
        if (dragging) {
            SDL_Rect r{std::min(dragX, curX), std::min(dragY, curY),
                       std::abs(curX - dragX), std::abs(curY - dragY)};
            SDL_SetRenderDrawColor(renderer, 255, 60, 60, 255);
            SDL_RenderDrawRect(renderer, &r);
            SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        }
        SDL_RenderPresent(renderer);

        SDL_Delay(16);
    }

    SDL_DestroyTexture(texture);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
