#ifndef REFLOW_TABS_TAB_TYPES_H
#define REFLOW_TABS_TAB_TYPES_H

#include "reflow/core/units.h"

#include <cstdint>
#include <string>
#include <vector>

namespace reflow::text {
class TextMeasurer;
} // namespace reflow::text

namespace reflow::tabs {

// ============================================================================
// Tab Stops
// ============================================================================

enum class TabAlignment : std::uint8_t {
    Start = 0,
    End = 1,
    Center = 2,
    Decimal = 3,
    Bar = 4,
    Clear = 5,
};

enum class TabLeader : std::uint8_t {
    None = 0,
    Dot = 1,
    Hyphen = 2,
    Heavy = 3,
    Underscore = 4,
    MiddleDot = 5,
};

// Position is in twips from the paragraph start.
struct TabStop {
    TabAlignment alignment = TabAlignment::Start;
    std::int32_t position = 0;
    TabLeader leader = TabLeader::None;
};

inline bool operator==(const TabStop& a, const TabStop& b) {
    return a.alignment == b.alignment && a.position == b.position && a.leader == b.leader;
}

inline bool operator!=(const TabStop& a, const TabStop& b) {
    return !(a == b);
}

// A stop converted to layout units (usually pixels) for run positioning.
struct LayoutStop {
    TabAlignment alignment = TabAlignment::Start;
    float position = 0.0f;
    TabLeader leader = TabLeader::None;
};

/**
 * Convert resolved twip stops into layout units.
 * @param unitsPerTwip Scale factor, CSS pixels by default
 */
inline std::vector<LayoutStop> toLayoutStops(const std::vector<TabStop>& stops, float unitsPerTwip = kPixelsPerTwip) {
    std::vector<LayoutStop> out;
    out.reserve(stops.size());
    for (const TabStop& stop : stops) {
        LayoutStop ls{};
        ls.alignment = stop.alignment;
        ls.position = static_cast<float>(stop.position) * unitsPerTwip;
        ls.leader = stop.leader;
        out.push_back(ls);
    }
    return out;
}

// Indents in twips. Hanging pulls the first line left of `left`.
struct ParagraphIndent {
    std::int32_t left = 0;
    std::int32_t hanging = 0;
    std::int32_t right = 0;
    std::int32_t firstLine = 0;
};

inline std::int32_t effectiveMinIndent(const ParagraphIndent& indent) {
    const std::int64_t start = static_cast<std::int64_t>(indent.left) - indent.hanging;
    if (start <= 0) return 0;
    return start > INT32_MAX ? INT32_MAX : static_cast<std::int32_t>(start);
}

// ============================================================================
// Runs
// ============================================================================

enum class RunKind : std::uint8_t {
    Text = 0,
    Tab = 1,
    LineBreak = 2,
};

// runId is opaque to the layout; it is handed back in RunPosition and to the
// measurer so callers can map results onto their own model.
struct TabbedRun {
    std::uint32_t runId = 0;
    RunKind kind = RunKind::Text;
    float width = 0.0f;
    std::string text; // Only read for decimal alignment
};

struct RunPosition {
    std::uint32_t runId = 0;
    float x = 0.0f;
    float width = 0.0f;
    bool hasTabStop = false;
    LayoutStop tabStop{};
};

struct LayoutWithTabsOptions {
    const text::TextMeasurer* measurer = nullptr;
    char decimalSeparator = '.';
};

// ============================================================================
// Single Tab Width
// ============================================================================

enum class TabWidthAlignment : std::uint8_t {
    Start = 0,
    End = 1,
    Center = 2,
    Decimal = 3,
    Bar = 4,
    Default = 6, // Repeating default grid, no stop matched
};

struct CalculateTabWidthParams {
    float currentX = 0.0f;
    std::vector<LayoutStop> tabStops; // Sorted, same units as currentX
    float paragraphWidth = 0.0f;
    float defaultTabDistance = 0.0f;
    float defaultLineLength = 0.0f;
    std::string followingText;
    const text::TextMeasurer* measurer = nullptr;
    std::uint32_t measureRunId = 0;
    char decimalSeparator = '.';
};

struct CalculateTabWidthResult {
    float width = 0.0f;
    bool hasLeader = false;
    TabLeader leader = TabLeader::None;
    TabWidthAlignment alignment = TabWidthAlignment::Default;
    float tabStopPosUsed = -1.0f; // -1 when the default grid was used
};

} // namespace reflow::tabs

#endif // REFLOW_TABS_TAB_TYPES_H
