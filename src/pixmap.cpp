#include "scrub/pixmap.hpp"
#include <cstdint>
#include <limits>
#include <utility>

namespace scrub {

Pixmap::Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels)
    : info_(info),
      pixels_(pixels),
      ownsPixels_(ownsPixels) {
}

Pixmap::~Pixmap() {
    reset();
}

Pixmap::Pixmap(Pixmap&& other) noexcept
    : info_(other.info_),
      pixels_(other.pixels_),
      ownsPixels_(other.ownsPixels_) {
    other.info_ = {};
    other.pixels_ = nullptr;
    other.ownsPixels_ = false;
}

Pixmap& Pixmap::operator=(Pixmap&& other) noexcept {
    if (this != &other) {
        reset();
        info_ = other.info_;
        pixels_ = other.pixels_;
        ownsPixels_ = other.ownsPixels_;
        other.info_ = {};
        other.pixels_ = nullptr;
        other.ownsPixels_ = false;
    }
    return *this;
}

Pixmap Pixmap::Alloc(const PixmapInfo& info) {
    if (info.width <= 0 || info.height <= 0 || int64_t(info.stride) < int64_t(info.width) * 4) {
        return Pixmap(info, nullptr, false);
    }
    // stride * height in 64 bits, rejected when size_t cannot hold it
    const u64 bytes = u64(info.stride) * u64(info.height);
    if (bytes > std::numeric_limits<size_t>::max()) return Pixmap(info, nullptr, false);
    void* pixels = std::calloc(size_t(bytes), 1);
    if (!pixels) return Pixmap(info, nullptr, false);
    return Pixmap(info, pixels, true);
}

Pixmap Pixmap::Wrap(const PixmapInfo& info, void* pixels) {
    return Pixmap(info, pixels, false);
}

Color Pixmap::getPixel(i32 x, i32 y) const {
    return unpackColor(pixelAddr(x, y), info_.format);
}

void Pixmap::setRGB(i32 x, i32 y, u8 r, u8 g, u8 b) {
    u8* p = pixelAddr(x, y);
    Color c = {r, g, b, p[3]};
    packColor(p, info_.format, c);
}

void Pixmap::setPixel(i32 x, i32 y, Color c) {
    packColor(pixelAddr(x, y), info_.format, c);
}

void Pixmap::clear(Color c) {
    if (!valid()) return;
    u8 packed[4];
    packColor(packed, info_.format, c);
    u32 value;
    std::memcpy(&value, packed, sizeof(u32));
    for (i32 y = 0; y < info_.height; ++y) {
        u32* row = static_cast<u32*>(rowAddr(y));
        for (i32 x = 0; x < info_.width; ++x) {
            row[x] = value;
        }
    }
}

void Pixmap::reset() {
    if (ownsPixels_ && pixels_) {
        std::free(pixels_);
    }
    pixels_ = nullptr;
    ownsPixels_ = false;
    info_ = {};
}

} // namespace scrub
