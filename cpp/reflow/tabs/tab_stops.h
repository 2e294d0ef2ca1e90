#ifndef REFLOW_TABS_TAB_STOPS_H
#define REFLOW_TABS_TAB_STOPS_H

#include "reflow/tabs/tab_types.h"

#include <cstdint>
#include <vector>

namespace reflow::tabs {

/**
 * Compute the full set of tab stops for a paragraph.
 *
 * Explicit stops before the first-line start (left - hanging) are dropped.
 * Clear stops suppress default stops near them and never appear in the
 * output. Default stops are generated every defaultInterval twips, never
 * before the left indent, and never within tolerance of an explicit or
 * cleared position.
 *
 * @param explicitStops Stops from the paragraph style (twips)
 * @param defaultInterval Default tab interval (twips)
 * @param indent Paragraph indentation (twips)
 * @return Stops sorted ascending by position
 */
std::vector<TabStop> computeTabStops(
    const std::vector<TabStop>& explicitStops,
    std::int32_t defaultInterval,
    const ParagraphIndent& indent
);

} // namespace reflow::tabs

#endif // REFLOW_TABS_TAB_STOPS_H
