// Command-line front end: erase a rectangle from one or more PPM/PAM images.
// Build via CMake target: scrub_cli

#include "cli_args.hpp"
#include <scrub/scrub.hpp>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s [options] <input.ppm|input.pam>...\n"
        "  --rect x,y,w,h   region to erase (default: bottom-right auto-detect)\n"
        "  --no-auto        do not fall back to auto-detect without --rect\n"
        "  --passes N       smoothing passes (default 8)\n"
        "  --margin N       texture sampling margin in pixels (default 50)\n"
        "  --grain F        grain strength (default 2)\n"
        "  --seed N         seed the random source for reproducible output\n"
        "  --output PATH    output file (single input only)\n"
        "  --quiet          no progress output\n"
        "Strategy: set SCRUB_INPAINTER (only 'local' is available).\n",
        argv0);
}

std::string makeOutputPath(const std::filesystem::path& inPath) {
    return (inPath.parent_path() /
            (inPath.stem().string() + "_clean" + inPath.extension().string()))
        .string();
}

} // namespace

int main(int argc, char** argv) {
    scrub::ProcessingOptions options;
    std::optional<scrub::Selection> rect;
    std::optional<scrub::u32> seed;
    std::string outputPath;
    bool quiet = false;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;
        scrub::i32 n = 0;
        scrub::f32 f = 0;
        scrub::u32 u = 0;

        if (arg == "--help" || arg == "-h") { printUsage(argv[0]); return 0; }
        else if (arg == "--no-auto") options.autoDetectEnabled = false;
        else if (arg == "--quiet") quiet = true;
        else if (arg == "--rect") {
            scrub::Selection s;
            if (!scrub::cli::parseRect(value, s)) { std::fprintf(stderr, "Bad --rect value\n"); return 1; }
            rect = s; ++i;
        }
        else if (arg == "--passes") {
            if (!scrub::cli::parseInt(value, n)) { std::fprintf(stderr, "Bad --passes value\n"); return 1; }
            options.passCount = n; ++i;
        }
        else if (arg == "--margin") {
            if (!scrub::cli::parseInt(value, n)) { std::fprintf(stderr, "Bad --margin value\n"); return 1; }
            options.marginWidth = n; ++i;
        }
        else if (arg == "--grain") {
            if (!scrub::cli::parseFloat(value, f)) { std::fprintf(stderr, "Bad --grain value\n"); return 1; }
            options.grainStrength = f; ++i;
        }
        else if (arg == "--seed") {
            if (!scrub::cli::parseSeed(value, u)) { std::fprintf(stderr, "Bad --seed value\n"); return 1; }
            seed = u; ++i;
        }
        else if (arg == "--output") {
            if (!value) { std::fprintf(stderr, "Missing --output value\n"); return 1; }
            outputPath = value; ++i;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::fprintf(stderr, "Unknown option %s\n", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
        else inputs.push_back(arg);
    }

    if (inputs.empty()) { printUsage(argv[0]); return 1; }
    if (!outputPath.empty() && inputs.size() != 1) {
        std::fprintf(stderr, "--output needs exactly one input\n");
        return 1;
    }
    if (!rect && !options.autoDetectEnabled) {
        std::fprintf(stderr, "No selection provided and auto-detect is disabled\n");
        return 1;
    }

    scrub::BatchQueue queue(scrub::Inpainters::MakeFromEnvironment(), options);
    int failures = 0;

    for (const auto& in : inputs) {
        scrub::Pixmap pm = scrub::decodeNetpbm(in);
        if (!pm.valid()) {
            std::fprintf(stderr, "Cannot decode %s\n", in.c_str());
            ++failures;
            continue;
        }
        queue.add(in, std::move(pm), rect);
    }
    if (options.autoDetectEnabled) queue.autoDetectMissing();

    if (!quiet) {
        queue.setJobProgressCallback([](const scrub::BatchJob& job) {
            std::printf("\r%s: %3d%% (%s)", job.label.c_str(), int(job.progress),
                        scrub::toString(job.status));
            if (job.status == scrub::JobStatus::Completed || job.status == scrub::JobStatus::Error) {
                std::printf("\n");
            }
            std::fflush(stdout);
        });
    }

    std::unique_ptr<scrub::RandomSource> random;
    scrub::InpaintContext ctx;
    if (seed) {
        random = scrub::RandomSource::MakeSeeded(*seed);
        ctx.random = random.get();
    }
    queue.processAll(ctx);

    for (const auto& job : queue.jobs()) {
        if (job.status != scrub::JobStatus::Completed) {
            std::fprintf(stderr, "%s: failed (%s)\n", job.label.c_str(), job.error.c_str());
            ++failures;
            continue;
        }
        const std::string out = outputPath.empty()
            ? makeOutputPath(std::filesystem::path(job.label)) : outputPath;
        if (!scrub::encodeNetpbm(job.pixmap, out)) {
            std::fprintf(stderr, "%s: cannot write %s\n", job.label.c_str(), out.c_str());
            ++failures;
            continue;
        }
        if (!quiet) {
            const scrub::Selection& s = *job.selection;
            std::printf("Saved %s (%s, region %d,%d %dx%d)\n", out.c_str(),
                        scrub::toString(job.lastStatus), s.x, s.y, s.width, s.height);
        }
    }

    if (!quiet) {
        std::printf("%d image(s): %d completed, %d failed\n",
                    int(inputs.size()), queue.stats().completed, failures);
    }
    return failures == 0 ? 0 : 1;
}
