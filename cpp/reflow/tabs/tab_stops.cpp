#include "reflow/tabs/tab_stops.h"

#include "reflow/core/constants.h"
#include "reflow/core/logging.h"

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace reflow::tabs {

namespace {

bool isNear(const std::vector<std::int32_t>& positions, std::int32_t pos) {
    for (std::int32_t p : positions) {
        if (std::llabs(static_cast<std::int64_t>(p) - pos) < constants::DEFAULT_STOP_TOLERANCE_TWIPS) {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<TabStop> computeTabStops(
    const std::vector<TabStop>& explicitStops,
    std::int32_t defaultInterval,
    const ParagraphIndent& indent
) {
    const std::int32_t leftIndent = indent.left;
    const std::int32_t minIndent = effectiveMinIndent(indent);

    std::vector<std::int32_t> clearPositions;
    std::vector<TabStop> stops;
    stops.reserve(explicitStops.size());

    for (const TabStop& stop : explicitStops) {
        if (stop.alignment == TabAlignment::Clear) {
            clearPositions.push_back(stop.position);
            continue;
        }
        // Stops between (left - hanging) and left serve the hanging first line
        if (stop.position >= minIndent) {
            stops.push_back(stop);
        }
    }

    std::int32_t maxExplicit = 0;
    std::vector<std::int32_t> explicitPositions;
    explicitPositions.reserve(stops.size());
    for (const TabStop& stop : stops) {
        maxExplicit = std::max(maxExplicit, stop.position);
        explicitPositions.push_back(stop.position);
    }
    const bool hasExplicit = !stops.empty();

    if (defaultInterval <= 0) {
        REFLOW_LOG_DEBUG("computeTabStops: non-positive default interval %d, no default stops", defaultInterval);
    } else {
        // Candidates run in 64 bits so stops near INT32_MAX cannot overflow
        const std::int64_t defaultStart = hasExplicit ? std::max(maxExplicit, leftIndent) : 0;
        const std::int64_t limit = std::max<std::int64_t>(defaultStart, leftIndent) + constants::DEFAULT_STOP_HORIZON_TWIPS;

        // The horizon is checked before stepping, so the last default may land past it
        std::int64_t next = defaultStart;
        if (next < leftIndent) {
            // Skip the candidates that would fall left of the indent
            next += ((leftIndent - next - 1) / defaultInterval) * defaultInterval;
        }
        while (next < limit) {
            next += defaultInterval;
            if (next > std::numeric_limits<std::int32_t>::max()) break;
            const std::int32_t pos = static_cast<std::int32_t>(next);

            // Defaults follow the body left indent even when hanging moves the first line
            if (pos < leftIndent) continue;
            if (isNear(explicitPositions, pos) || isNear(clearPositions, pos)) continue;

            TabStop stop{};
            stop.alignment = TabAlignment::Start;
            stop.position = pos;
            stop.leader = TabLeader::None;
            stops.push_back(stop);
        }
    }

    std::stable_sort(stops.begin(), stops.end(), [](const TabStop& a, const TabStop& b) {
        return a.position < b.position;
    });
    return stops;
}

} // namespace reflow::tabs
