#pragma once

#include "reflow/core/constants.h"

#include <cmath>
#include <cstdint>

namespace reflow {

inline float twipsToPixels(std::int32_t twips) {
    return static_cast<float>(twips) * constants::PIXELS_PER_INCH / static_cast<float>(constants::TWIPS_PER_INCH);
}

inline std::int32_t pixelsToTwips(float pixels) {
    return static_cast<std::int32_t>(std::lround(pixels * static_cast<float>(constants::TWIPS_PER_INCH) / constants::PIXELS_PER_INCH));
}

// Scale factor for tabs::toLayoutStops when laying out in CSS pixels.
constexpr float kPixelsPerTwip = constants::PIXELS_PER_INCH / static_cast<float>(constants::TWIPS_PER_INCH);

} // namespace reflow
