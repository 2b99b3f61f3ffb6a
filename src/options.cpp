#include "scrub/options.hpp"

namespace scrub {

namespace {
i32 atLeast(i32 v, i32 lo) { return v < lo ? lo : v; }
// NaN compares false and ends up at lo as well
f32 atLeast(f32 v, f32 lo) { return v >= lo ? v : lo; }
i32 atMost(i32 v, i32 hi) { return v > hi ? hi : v; }
f32 atMost(f32 v, f32 hi) { return v > hi ? hi : v; }
}

ProcessingOptions ProcessingOptions::sanitized() const {
    ProcessingOptions o = *this;
    o.passCount = atLeast(passCount, 0);
    o.marginWidth = atLeast(marginWidth, 0);
    o.grainStrength = atMost(atLeast(grainStrength, 0.0f), kMaxGrainStrength);
    o.textureInjectionProbability = atMost(atLeast(textureInjectionProbability, 0.0f), 1.0f);

    o.sampleRadiusCap = atMost(atLeast(sampleRadiusCap, 0), kMaxWindowRadius);
    o.textureSamplesPerPixel = atLeast(textureSamplesPerPixel, 0);
    o.textureSampleWeight = atLeast(textureSampleWeight, 0.0f);
    o.smoothRadius = atMost(atLeast(smoothRadius, 0), kMaxWindowRadius);
    o.featherWidth = atMost(atLeast(featherWidth, 0), kMaxWindowRadius);
    o.yieldEveryLayers = atLeast(yieldEveryLayers, 1);
    return o;
}

} // namespace scrub
