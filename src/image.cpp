#include "scrub/image.hpp"
#include <cstring>
#include <utility>

namespace scrub {

Image::Image(const PixmapInfo& info, Pixmap owned)
    : info_(info),
      pixels_(std::move(owned)) {
}

std::shared_ptr<Image> Image::MakeFromPixmap(const Pixmap& src) {
    if (!src.valid()) return nullptr;

    // Copy row by row so wrapped buffers with padded strides snapshot correctly
    PixmapInfo info = PixmapInfo::Make(src.width(), src.height(), src.format());
    Pixmap copy = Pixmap::Alloc(info);
    if (!copy.valid()) return nullptr;

    const size_t rowBytes = size_t(src.width()) * 4;
    for (i32 y = 0; y < src.height(); ++y) {
        std::memcpy(copy.rowAddr(y), src.rowAddr(y), rowBytes);
    }

    return std::shared_ptr<Image>(new Image(info, std::move(copy)));
}

} // namespace scrub
