#ifndef REFLOW_TABS_PARAGRAPH_TAB_LAYOUT_H
#define REFLOW_TABS_PARAGRAPH_TAB_LAYOUT_H

#include "reflow/core/constants.h"
#include "reflow/tabs/tab_types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace reflow::tabs {

// One flattened paragraph child. Text spans carry their text; tab and line
// break spans only need an id.
struct ParagraphSpan {
    std::uint32_t spanId = 0;
    RunKind kind = RunKind::Text;
    std::string text;
};

// Paragraph indents in layout units.
struct ParagraphIndentPx {
    float left = 0.0f;
    float right = 0.0f;
    float firstLine = 0.0f;
    float hanging = 0.0f;
};

struct ParagraphTabRequest {
    std::uint32_t paragraphId = 0;
    std::uint32_t revision = 0;
    std::vector<ParagraphSpan> spans;
    std::vector<LayoutStop> tabStops;
    float paragraphWidth = constants::DEFAULT_LINE_LENGTH_PX;
    float defaultTabDistance = constants::DEFAULT_TAB_DISTANCE_PX;
    float defaultLineLength = constants::DEFAULT_LINE_LENGTH_PX;
    ParagraphIndentPx indents{};
    float indentWidth = 0.0f; // First-line start: margin-left plus text-indent
};

struct TabLayoutEntry {
    std::uint32_t spanId = 0;
    std::uint32_t tabIndex = 0; // Ordinal among the paragraph's tabs
    CalculateTabWidthResult metrics{};
};

struct ParagraphTabLayout {
    std::uint32_t paragraphId = 0;
    std::uint32_t revision = 0;
    std::vector<TabLayoutEntry> tabs;

    const TabLayoutEntry* findTab(std::uint32_t tabIndex) const;
};

/**
 * Resolve the rendered width of every tab in a paragraph.
 *
 * Walks spans left to right tracking the pen position. Text that would
 * overflow the paragraph width wraps to the wrapped-line start (left indent
 * without the first-line offset). Line breaks reset to the same position.
 * Each tab is resolved with calculateTabWidth against the text that follows
 * it up to the next tab or line break.
 *
 * @param request Paragraph geometry and spans (layout units)
 * @param measurer Optional measurer, queried with span ids; widths are 0 without one
 */
ParagraphTabLayout calculateParagraphTabLayout(
    const ParagraphTabRequest& request,
    const text::TextMeasurer* measurer
);

/**
 * Insert the implicit start stop a hanging indent creates at the body start.
 * The stop is placed first, ahead of the style stops.
 */
void prependHangingStop(std::vector<LayoutStop>& stops, float indentWidth, float hangingPx);

/**
 * Concatenated text of the spans after startIndex, up to the next tab or line break.
 */
std::string collectFollowingText(const std::vector<ParagraphSpan>& spans, std::size_t startIndex);

} // namespace reflow::tabs

#endif // REFLOW_TABS_PARAGRAPH_TAB_LAYOUT_H
