#pragma once

/**
 * @file inpainter.hpp
 * @brief Inpainting strategy interface, the local pipeline, and the entry point.
 */

#include "scrub/types.hpp"
#include "scrub/pixmap.hpp"
#include "scrub/selection.hpp"
#include "scrub/options.hpp"
#include "scrub/checkpoint.hpp"
#include <memory>
#include <string_view>

namespace scrub {

class RandomSource;

/// @brief Outcome of one inpaint call.
enum class InpaintStatus : u8 {
    Processed,            ///< The selection was refilled.
    DegenerateSelection,  ///< Empty selection after clamping, or no pixels; buffer untouched.
    EmptyTextureBank,     ///< No exterior pixels within the margin; buffer untouched.
    Cancelled,            ///< The scheduler asked to stop; buffer restored to its input.
    AllocationFailed,     ///< A snapshot could not be allocated; buffer untouched.
};

/// @brief Human-readable status name.
const char* toString(InpaintStatus status);

/// @brief Host-provided hooks for one call. All fields are optional.
struct InpaintContext {
    /// Random source for texture injection and grain. When null, a source
    /// seeded from std::random_device is created for the call.
    RandomSource* random = nullptr;
    /// Progress receiver, called with non-decreasing values ending at 100.
    ProgressCallback progress;
    /// Cooperative scheduling hook, called at every checkpoint.
    Scheduler* scheduler = nullptr;
};

/**
 * Inpainter - Abstract inpainting strategy.
 *
 * A strategy receives the whole image and a rectangular region and rewrites
 * the pixels inside the region. Pixels outside it and the alpha channel are
 * left untouched. The call owns the pixmap exclusively until it returns.
 *
 * LocalInpainter is the only strategy shipped; a remote service would plug in
 * behind the same interface.
 */
class Inpainter {
public:
    virtual ~Inpainter() = default;

    /// @brief Refill @p selection in @p pixmap in place.
    virtual InpaintStatus inpaint(Pixmap& pixmap, const Selection& selection,
                                  const ProcessingOptions& options,
                                  const InpaintContext& context) = 0;

    /// @brief Short identifier of the strategy (e.g. "local").
    virtual const char* name() const = 0;
};

/**
 * LocalInpainter - Texture-bank, distance-ordered fill pipeline on the CPU.
 *
 * Stages: clamp selection, build texture bank, fill with the bank mean,
 * progressive fill by distance layer, smoothing passes, edge feathering,
 * grain. Progress: 20 after the mean fill, 20..70 during the layers, 75 after
 * the fill, 75..90 during smoothing, 92 after smoothing, 100 at the end.
 */
class LocalInpainter : public Inpainter {
public:
    InpaintStatus inpaint(Pixmap& pixmap, const Selection& selection,
                          const ProcessingOptions& options,
                          const InpaintContext& context) override;

    const char* name() const override { return "local"; }
};

/// @brief Factory functions for inpainting strategies.
namespace Inpainters {

/// @brief Create the local CPU strategy.
std::unique_ptr<Inpainter> MakeLocal();

/// @brief Create a strategy by name. "local" and "" give LocalInpainter;
///        unknown names log a warning and fall back to it.
std::unique_ptr<Inpainter> Make(std::string_view name);

/// @brief Create the strategy named by the SCRUB_INPAINTER environment variable.
std::unique_ptr<Inpainter> MakeFromEnvironment();

} // namespace Inpainters

/// @brief Run the local pipeline on @p pixmap.
InpaintStatus inpaint(Pixmap& pixmap, const Selection& selection,
                      const ProcessingOptions& options = {},
                      const InpaintContext& context = {});

} // namespace scrub
