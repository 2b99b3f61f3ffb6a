#include "scrub/random.hpp"

namespace scrub {

std::unique_ptr<RandomSource> RandomSource::MakeDefault() {
    std::random_device rd;
    return std::make_unique<StdRandom>(rd());
}

std::unique_ptr<RandomSource> RandomSource::MakeSeeded(u32 seed) {
    return std::make_unique<StdRandom>(seed);
}

} // namespace scrub
