#pragma once

/**
 * @file stages.hpp
 * @brief The individual passes of the inpainting pipeline.
 *
 * Each stage mutates the target Pixmap inside the selection only and never
 * touches alpha. Stages run in the order declared here; LocalInpainter wires
 * them together, but they are usable on their own.
 */

#include "scrub/types.hpp"
#include "scrub/pixmap.hpp"
#include "scrub/image.hpp"
#include "scrub/selection.hpp"
#include "scrub/options.hpp"
#include "scrub/texture_bank.hpp"
#include "scrub/distance_field.hpp"
#include "scrub/checkpoint.hpp"

namespace scrub {

class RandomSource;

/// @brief Round a channel accumulator half-up and clamp it to 0–255 (NaN gives 0).
u8 roundChannel(f64 v);

/// @brief Paint every selection pixel with @p color, keeping alpha.
void fillWithMean(Pixmap& target, const Selection& selection, TextureSample color);

/**
 * @brief Layer-by-layer fill from the selection edge toward its center.
 *
 * Layer L holds the pixels whose distance field value is L. A pixel in layer
 * L takes the weighted mean of
 *   - neighbors within radius min(sampleRadiusCap, marginWidth) that are
 *     outside the selection (read from @p original), or inside with a
 *     distance below L (read from @p target, already final), each weighted
 *     1 / (1 + d * 0.3);
 *   - textureSamplesPerPixel random bank colors at textureSampleWeight.
 * Neighbors at layer L or deeper are never read.
 *
 * Reports progress 20..70 and yields every yieldEveryLayers layers.
 * @param original Snapshot of the buffer taken before fillWithMean().
 * @return False when the host cancelled at a yield point.
 */
bool progressiveFill(Pixmap& target, const Image& original,
                     const Selection& selection, const DistanceField& field,
                     const TextureBank& bank, const ProcessingOptions& options,
                     RandomSource& random, Checkpoint& checkpoint);

/**
 * @brief Box-blur the selection @p passCount times.
 *
 * Every iteration averages the (2*radius+1)^2 window, clipped to the image,
 * from a snapshot of the previous iteration. Reports progress 75..90 and
 * yields after each pass.
 * @return False when the host cancelled at a yield point.
 */
bool smoothSelection(Pixmap& target, const Selection& selection,
                     i32 passCount, i32 radius, Checkpoint& checkpoint);

/**
 * @brief Blend the boundary band toward the nearest true exterior color.
 *
 * Pixels with distance d < featherWidth become
 * current * (d / featherWidth) + exterior * (1 - d / featherWidth), where
 * exterior is the closest pixel outside the selection within a
 * featherWidth window (first found wins ties), read from @p original.
 * Pixels without any exterior pixel in reach are left alone.
 */
void featherEdges(Pixmap& target, const Image& original,
                  const Selection& selection, const DistanceField& field,
                  i32 featherWidth);

/// @brief Add independent uniform noise in [-strength, strength] to each
///        color channel of every selection pixel.
void addGrain(Pixmap& target, const Selection& selection, f32 strength,
              RandomSource& random);

} // namespace scrub
