#pragma once

#include "scrub/types.hpp"
#include "scrub/pixmap.hpp"
#include <memory>

namespace scrub {

/**
 * Image - An immutable snapshot of pixel data.
 *
 * Pipeline stages take a snapshot of the working Pixmap at entry whenever
 * they must tell "value before this stage" apart from "value being written":
 * the fill reads exterior pixels from the pre-fill snapshot, each smoothing
 * iteration reads the previous iteration's snapshot, and feathering reads the
 * true exterior colors from the pre-fill snapshot.
 */
class Image {
public:
    // Create an image by copying pixel data from a Pixmap
    static std::shared_ptr<Image> MakeFromPixmap(const Pixmap& src);

    i32 width() const { return info_.width; }
    i32 height() const { return info_.height; }
    PixelFormat format() const { return info_.format; }
    const PixmapInfo& info() const { return info_; }

    const void* pixels() const { return pixels_.addr(); }
    i32 stride() const { return info_.stride; }

    // Read pixel (x, y); no bounds checking.
    Color getPixel(i32 x, i32 y) const { return pixels_.getPixel(x, y); }

    bool valid() const { return pixels_.valid(); }

private:
    Image(const PixmapInfo& info, Pixmap owned);

    PixmapInfo info_;
    Pixmap pixels_;
};

} // namespace scrub
