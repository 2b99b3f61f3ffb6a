#include "scrub/inpainter.hpp"
#include "scrub/image.hpp"
#include "scrub/random.hpp"
#include "scrub/stages.hpp"
#include "scrub/texture_bank.hpp"
#include "scrub/distance_field.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace scrub {

namespace {

constexpr f32 kProgressMeanFilled = 20.0f;
constexpr f32 kProgressFillDone = 75.0f;
constexpr f32 kProgressSmoothDone = 92.0f;
constexpr f32 kProgressDone = 100.0f;

// Put the selection back the way the snapshot saw it
void restoreSelection(Pixmap& target, const Image& original, const Selection& selection) {
    const size_t rowBytes = size_t(selection.width) * 4;
    const u8* src = static_cast<const u8*>(original.pixels());
    for (i32 y = selection.y; y < selection.y + selection.height; ++y) {
        std::memcpy(target.pixelAddr(selection.x, y),
                    src + size_t(y) * size_t(original.stride()) + size_t(selection.x) * 4,
                    rowBytes);
    }
}

} // namespace

const char* toString(InpaintStatus status) {
    switch (status) {
    case InpaintStatus::Processed: return "processed";
    case InpaintStatus::DegenerateSelection: return "degenerate selection";
    case InpaintStatus::EmptyTextureBank: return "empty texture bank";
    case InpaintStatus::Cancelled: return "cancelled";
    case InpaintStatus::AllocationFailed: return "allocation failed";
    }
    return "unknown";
}

InpaintStatus LocalInpainter::inpaint(Pixmap& pixmap, const Selection& selection,
                                      const ProcessingOptions& options,
                                      const InpaintContext& context) {
    if (!pixmap.valid()) {
        std::fprintf(stderr, "scrub LocalInpainter: invalid pixmap, nothing to do\n");
        return InpaintStatus::DegenerateSelection;
    }

    const ProcessingOptions opts = options.sanitized();
    const Selection sel = selection.clamped(pixmap.width(), pixmap.height());
    if (sel.isEmpty()) {
        std::fprintf(stderr, "scrub LocalInpainter: degenerate selection (%d,%d %dx%d) on %dx%d image\n",
                     selection.x, selection.y, selection.width, selection.height,
                     pixmap.width(), pixmap.height());
        return InpaintStatus::DegenerateSelection;
    }

    const TextureBank bank = TextureBank::Build(pixmap, sel, opts.marginWidth);
    if (bank.empty()) {
        std::fprintf(stderr, "scrub LocalInpainter: no texture samples within %d px of (%d,%d %dx%d)\n",
                     opts.marginWidth, sel.x, sel.y, sel.width, sel.height);
        return InpaintStatus::EmptyTextureBank;
    }

    std::shared_ptr<Image> original = Image::MakeFromPixmap(pixmap);
    if (!original) {
        std::fprintf(stderr, "scrub LocalInpainter: snapshot allocation failed (%dx%d)\n",
                     pixmap.width(), pixmap.height());
        return InpaintStatus::AllocationFailed;
    }

    std::unique_ptr<RandomSource> ownedRandom;
    RandomSource* random = context.random;
    if (!random) {
        ownedRandom = RandomSource::MakeDefault();
        random = ownedRandom.get();
    }

    Checkpoint checkpoint(context.progress, context.scheduler);
    const DistanceField field = DistanceField::Make(sel);

    fillWithMean(pixmap, sel, bank.mean());
    checkpoint.report(kProgressMeanFilled);

    bool finished = checkpoint.yield() &&
                    progressiveFill(pixmap, *original, sel, field, bank, opts, *random, checkpoint);
    if (finished) {
        checkpoint.report(kProgressFillDone);
        finished = smoothSelection(pixmap, sel, opts.passCount, opts.smoothRadius, checkpoint);
    }
    if (!finished) {
        restoreSelection(pixmap, *original, sel);
        return InpaintStatus::Cancelled;
    }
    checkpoint.report(kProgressSmoothDone);

    featherEdges(pixmap, *original, sel, field, opts.featherWidth);
    addGrain(pixmap, sel, opts.grainStrength, *random);

    checkpoint.report(kProgressDone);
    return InpaintStatus::Processed;
}

namespace Inpainters {

std::unique_ptr<Inpainter> MakeLocal() {
    return std::make_unique<LocalInpainter>();
}

std::unique_ptr<Inpainter> Make(std::string_view name) {
    if (name.empty() || name == "local") {
        return MakeLocal();
    }
    const std::string requested(name);
    std::fprintf(stderr, "scrub Inpainters: unknown strategy '%s', using local\n", requested.c_str());
    return MakeLocal();
}

std::unique_ptr<Inpainter> MakeFromEnvironment() {
    const char* env = std::getenv("SCRUB_INPAINTER");
    return Make(env ? std::string_view(env) : std::string_view());
}

} // namespace Inpainters

InpaintStatus inpaint(Pixmap& pixmap, const Selection& selection,
                      const ProcessingOptions& options,
                      const InpaintContext& context) {
    LocalInpainter local;
    return local.inpaint(pixmap, selection, options, context);
}

} // namespace scrub
