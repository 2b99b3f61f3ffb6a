#pragma once

/**
 * @file texture_bank.hpp
 * @brief Pool of exterior colors sampled from a ring around the selection.
 */

#include "scrub/types.hpp"
#include "scrub/pixmap.hpp"
#include "scrub/selection.hpp"
#include <cstddef>
#include <vector>

namespace scrub {

class RandomSource;

/// @brief One exterior color sample.
struct TextureSample {
    u8 r = 0;
    u8 g = 0;
    u8 b = 0;
};

/**
 * @brief Colors collected from the margin ring outside a selection.
 *
 * The ring is the selection grown by the margin on every side, clipped to
 * the image, minus the selection itself. Samples are stored in row-major scan
 * order and never include a pixel inside the selection.
 */
class TextureBank {
public:
    /// @brief Scan the margin ring of @p selection in @p pixmap.
    /// @param pixmap Source pixels (not modified).
    /// @param selection Clamped, non-degenerate selection.
    /// @param marginWidth Ring width in pixels; 0 yields an empty bank.
    static TextureBank Build(const Pixmap& pixmap, const Selection& selection, i32 marginWidth);

    bool empty() const { return samples_.empty(); }
    size_t size() const { return samples_.size(); }
    const std::vector<TextureSample>& samples() const { return samples_; }

    /// @brief Per-channel mean, rounded to the nearest integer.
    /// @note Returns black for an empty bank.
    TextureSample mean() const;

    /// @brief Uniformly drawn sample.
    /// @note The bank must not be empty.
    const TextureSample& pick(RandomSource& random) const;

private:
    std::vector<TextureSample> samples_;
};

} // namespace scrub
