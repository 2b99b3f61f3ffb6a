#pragma once

/**
 * @file pixmap.hpp
 * @brief Pixel format, pixel buffer descriptor, and owning/non-owning pixel buffer.
 */

#include "scrub/types.hpp"
#include <cstddef>
#include <cstdlib>
#include <cstring>

namespace scrub {

/// @brief Pixel format enumeration.
///
/// Both formats keep alpha in byte 3, so the inpainting stages (which treat
/// the three color channels alike) work on either without conversion.
enum class PixelFormat {
    RGBA8888,  ///< Red-Green-Blue-Alpha, 8 bits each.
    BGRA8888,  ///< Blue-Green-Red-Alpha, 8 bits each (native on many platforms).
};

/// @brief Descriptor for pixel buffer dimensions, stride, and format.
struct PixmapInfo {
    i32 width = 0;   ///< Width in pixels.
    i32 height = 0;  ///< Height in pixels.
    i32 stride = 0;  ///< Bytes per row.
    PixelFormat format = PixelFormat::RGBA8888; ///< Pixel format.

    /// @brief Get bytes per pixel (always 4 for current formats).
    /// @return Bytes per pixel.
    i32 bytesPerPixel() const { return 4; }

    /// @brief Compute total byte size of the pixel buffer.
    /// @return stride × height, or 0 when either is not positive.
    size_t computeByteSize() const {
        if (stride <= 0 || height <= 0) return 0;
        return size_t(stride) * size_t(height);
    }

    /// @brief Create a PixmapInfo with the given dimensions and format.
    /// @param w Width in pixels.
    /// @param h Height in pixels.
    /// @param fmt Pixel format.
    /// @return A new PixmapInfo.
    static PixmapInfo Make(i32 w, i32 h, PixelFormat fmt) {
        PixmapInfo info;
        info.width = w;
        info.height = h;
        info.format = fmt;
        info.stride = (w > 0 && w <= INT32_MAX / 4) ? w * 4 : 0;
        return info;
    }

    /// @brief Create a PixmapInfo with RGBA8888 format.
    static PixmapInfo MakeRGBA(i32 w, i32 h) { return Make(w, h, PixelFormat::RGBA8888); }

    /// @brief Create a PixmapInfo with BGRA8888 format.
    static PixmapInfo MakeBGRA(i32 w, i32 h) { return Make(w, h, PixelFormat::BGRA8888); }
};

/// @brief Owning or non-owning pixel buffer.
///
/// Use Alloc() to create an owned buffer, or Wrap() to reference external memory.
/// The inpainting engine mutates a Pixmap in place and never keeps a reference
/// to it past the call.
class Pixmap {
public:
    /// @brief Allocate a new zero-filled pixel buffer described by info.
    /// @param info Dimensions, stride, and format of the buffer.
    /// @return A new Pixmap that owns its pixel data, or an invalid Pixmap
    ///         when the dimensions are not positive, the stride is too short,
    ///         or the byte size cannot be allocated.
    static Pixmap Alloc(const PixmapInfo& info);

    /// @brief Wrap existing pixel memory (caller keeps ownership).
    /// @param info Dimensions, stride, and format of the buffer.
    /// @param pixels Pointer to the external pixel data.
    /// @return A non-owning Pixmap.
    static Pixmap Wrap(const PixmapInfo& info, void* pixels);

    Pixmap() = default;
    ~Pixmap();

    Pixmap(Pixmap&& other) noexcept;
    Pixmap& operator=(Pixmap&& other) noexcept;

    Pixmap(const Pixmap&) = delete;
    Pixmap& operator=(const Pixmap&) = delete;

    /// @brief Get raw pixel pointer (mutable).
    void* addr() { return pixels_; }
    /// @brief Get raw pixel pointer (const).
    const void* addr() const { return pixels_; }
    /// @brief Get pixel pointer as u8* (mutable).
    u8* addr8() { return static_cast<u8*>(pixels_); }
    /// @brief Get pixel pointer as u8* (const).
    const u8* addr8() const { return static_cast<const u8*>(pixels_); }

    /// @brief Get the pixmap info descriptor.
    const PixmapInfo& info() const { return info_; }
    /// @brief Get width in pixels.
    i32 width() const { return info_.width; }
    /// @brief Get height in pixels.
    i32 height() const { return info_.height; }
    /// @brief Get row stride in bytes.
    i32 stride() const { return info_.stride; }
    /// @brief Get pixel format.
    PixelFormat format() const { return info_.format; }

    /// @brief Check if the pixmap has valid pixel data.
    /// @return True if pixels are non-null and dimensions are positive.
    bool valid() const { return pixels_ != nullptr && info_.width > 0 && info_.height > 0; }

    /// @brief Get pointer to the start of a specific row (mutable).
    /// @param y Row index.
    void* rowAddr(i32 y) { return addr8() + size_t(y) * size_t(info_.stride); }
    /// @brief Get pointer to the start of a specific row (const).
    /// @param y Row index.
    const void* rowAddr(i32 y) const { return addr8() + size_t(y) * size_t(info_.stride); }

    /// @brief Get pointer to the four bytes of pixel (x, y).
    u8* pixelAddr(i32 x, i32 y) {
        return addr8() + size_t(y) * size_t(info_.stride) + size_t(x) * 4;
    }
    /// @copydoc pixelAddr()
    const u8* pixelAddr(i32 x, i32 y) const {
        return addr8() + size_t(y) * size_t(info_.stride) + size_t(x) * 4;
    }

    /// @brief Read pixel (x, y) as a Color, honoring the pixel format.
    /// @note No bounds checking; the caller keeps x and y inside the buffer.
    Color getPixel(i32 x, i32 y) const;

    /// @brief Write the color channels of pixel (x, y), leaving alpha untouched.
    void setRGB(i32 x, i32 y, u8 r, u8 g, u8 b);

    /// @brief Write a full pixel (x, y) including alpha.
    void setPixel(i32 x, i32 y, Color c);

    /// @brief Fill the entire buffer with a color.
    /// @param c The fill color.
    void clear(Color c);

    /// @brief Release pixel data and reset to empty state.
    void reset();

private:
    Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels);

    PixmapInfo info_;
    void* pixels_ = nullptr;
    bool ownsPixels_ = false;
};

/// @brief Decode four raw bytes laid out in @p fmt into a Color.
inline Color unpackColor(const u8* p, PixelFormat fmt) {
    if (fmt == PixelFormat::BGRA8888) return {p[2], p[1], p[0], p[3]};
    return {p[0], p[1], p[2], p[3]};
}

/// @brief Encode a Color into four raw bytes laid out in @p fmt.
inline void packColor(u8* p, PixelFormat fmt, Color c) {
    if (fmt == PixelFormat::BGRA8888) {
        p[0] = c.b; p[1] = c.g; p[2] = c.r;
    } else {
        p[0] = c.r; p[1] = c.g; p[2] = c.b;
    }
    p[3] = c.a;
}

}
