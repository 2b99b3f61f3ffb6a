#pragma once

/**
 * @file options.hpp
 * @brief Tuning knobs for one inpaint call.
 */

#include "scrub/types.hpp"

namespace scrub {

/// Largest useful grain amplitude; noise past one channel range only saturates.
constexpr f32 kMaxGrainStrength = 255.0f;
/// Upper bound for the fill, smoothing and feathering window radii.
constexpr i32 kMaxWindowRadius = 1024;

/// @brief Processing options for the inpainting pipeline.
///
/// The first five fields are the user-facing knobs. The rest are the stage
/// policies; their defaults are the values the pipeline was tuned with and
/// rarely need changing.
struct ProcessingOptions {
    i32 passCount = 8;                         ///< Smoothing iterations (0 skips smoothing).
    i32 marginWidth = 50;                      ///< Width of the texture-sampling ring.
    f32 grainStrength = 2.0f;                  ///< Noise amplitude per channel.
    f32 textureInjectionProbability = 0.2f;    ///< Kept for configuration compatibility; see DESIGN.md.
    bool autoDetectEnabled = true;             ///< Fall back to the positional guess without a user rectangle.

    i32 sampleRadiusCap = 10;                  ///< Fill neighborhood radius is min(cap, marginWidth).
    i32 textureSamplesPerPixel = 2;            ///< Random bank draws per filled pixel.
    f32 textureSampleWeight = 0.1f;            ///< Weight of each bank draw.
    i32 smoothRadius = 2;                      ///< Box-blur window radius.
    i32 featherWidth = 4;                      ///< Width of the seam-blending band.
    i32 yieldEveryLayers = 3;                  ///< Fill layers between cooperative yields.

    /// @brief Copy with every field forced into its usable range.
    ///
    /// Negative counts, widths and strengths become 0, the probability is
    /// clamped to [0, 1] and yieldEveryLayers to at least 1. grainStrength is
    /// capped at kMaxGrainStrength and the window radii at kMaxWindowRadius.
    ProcessingOptions sanitized() const;
};

} // namespace scrub
