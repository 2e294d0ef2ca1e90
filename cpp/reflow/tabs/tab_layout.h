#ifndef REFLOW_TABS_TAB_LAYOUT_H
#define REFLOW_TABS_TAB_LAYOUT_H

#include "reflow/tabs/tab_types.h"

#include <vector>

namespace reflow::tabs {

/**
 * Layout runs with tab awareness, computing horizontal positions.
 *
 * Alignment handling:
 * - Start: text begins at the stop
 * - End: text ends at the stop
 * - Center: text is centered on the stop
 * - Decimal: the decimal separator sits on the stop
 * - Bar: no positioning effect (painters draw the rule)
 *
 * Stops are consumed left to right and never revisited. A pending alignment
 * applies to exactly one following content run. Computed x is never negative.
 *
 * @param runs Runs with pre-computed widths (layout units)
 * @param stops Sorted stops, positions converted to layout units
 * @param lineWidth Available line width (layout units)
 * @param options Optional measurer and decimal separator
 * @return One RunPosition per input run, in input order
 */
std::vector<RunPosition> layoutWithTabs(
    const std::vector<TabbedRun>& runs,
    const std::vector<LayoutStop>& stops,
    float lineWidth,
    const LayoutWithTabsOptions& options = LayoutWithTabsOptions{}
);

/**
 * Compute the width a single tab occupies at currentX.
 *
 * Falls back to the repeating default grid when no usable stop exists or the
 * gap to the matched stop is below one unit.
 */
CalculateTabWidthResult calculateTabWidth(const CalculateTabWidthParams& params);

} // namespace reflow::tabs

#endif // REFLOW_TABS_TAB_LAYOUT_H
