#pragma once

/**
 * @file constants.h
 * @brief Layout and synchronization constants shared by all reflow modules.
 *
 * Tab-stop values are in twips (1/1440 inch). Pixel values are CSS pixels
 * (96 per inch).
 */

#include <cstdint>

namespace reflow::constants {

// =============================================================================
// Units
// =============================================================================

constexpr std::int32_t TWIPS_PER_INCH = 1440;
constexpr float PIXELS_PER_INCH = 96.0f;

// =============================================================================
// Tab Stops (twips)
// =============================================================================

/// Default tab interval (0.5 inch)
constexpr std::int32_t DEFAULT_TAB_INTERVAL_TWIPS = 720;

/// Default stops closer than this to an explicit or cleared stop are suppressed
constexpr std::int32_t DEFAULT_STOP_TOLERANCE_TWIPS = 20;

/// Default stops are generated up to this distance past the start (10 inches)
constexpr std::int32_t DEFAULT_STOP_HORIZON_TWIPS = 14400;

// =============================================================================
// Paragraph Tab Layout (pixels)
// =============================================================================

/// Default tab distance used by the repeating fallback grid (0.5 inch)
constexpr float DEFAULT_TAB_DISTANCE_PX =
    static_cast<float>(DEFAULT_TAB_INTERVAL_TWIPS) * PIXELS_PER_INCH / static_cast<float>(TWIPS_PER_INCH);

/// Default line length used by the repeating fallback grid (8.5 inch)
constexpr float DEFAULT_LINE_LENGTH_PX = 816.0f;

/// Content within this distance of the paragraph edge is treated as wrapping
constexpr float SOFT_WRAP_THRESHOLD_PX = 5.0f;

// =============================================================================
// Epoch Tracking
// =============================================================================

/// Number of epoch transitions retained for position mapping
constexpr std::int64_t DEFAULT_MAX_EPOCHS_TO_KEEP = 100;

} // namespace reflow::constants
