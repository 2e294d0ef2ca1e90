#include "reflow/epoch/step_map.h"

#include "reflow/core/logging.h"

#include <utility>

namespace reflow::epoch {

StepMap::StepMap(std::vector<std::int64_t> ranges, bool inverted)
    : ranges_(std::move(ranges)), inverted_(inverted) {
    if (ranges_.size() % 3 != 0) {
        REFLOW_LOG_WARN("StepMap: %zu range values is not a multiple of 3, truncating", ranges_.size());
        ranges_.resize(ranges_.size() - ranges_.size() % 3);
    }
}

StepMap StepMap::insertion(std::int64_t at, std::int64_t size) {
    return StepMap({at, 0, size});
}

StepMap StepMap::deletion(std::int64_t from, std::int64_t to) {
    return StepMap({from, to - from, 0});
}

StepMap StepMap::replacement(std::int64_t from, std::int64_t to, std::int64_t newSize) {
    return StepMap({from, to - from, newSize});
}

StepMap StepMap::offset(std::int64_t n) {
    if (n == 0) return StepMap();
    return n < 0 ? StepMap({0, -n, 0}) : StepMap({0, 0, n});
}

MapResult StepMap::mapResult(std::int64_t pos, int assoc) const {
    std::int64_t diff = 0;
    const std::size_t oldIndex = inverted_ ? 2 : 1;
    const std::size_t newIndex = inverted_ ? 1 : 2;

    for (std::size_t i = 0; i + 2 < ranges_.size(); i += 3) {
        const std::int64_t start = ranges_[i] - (inverted_ ? diff : 0);
        if (start > pos) break;

        const std::int64_t oldSize = ranges_[i + oldIndex];
        const std::int64_t newSize = ranges_[i + newIndex];
        const std::int64_t end = start + oldSize;

        if (pos <= end) {
            const int side = oldSize == 0 ? assoc : pos == start ? -1 : pos == end ? 1 : assoc;

            MapResult result{};
            result.pos = start + diff + (side < 0 ? 0 : newSize);
            result.delInfo = pos == start ? MapResult::DEL_AFTER
                : pos == end ? MapResult::DEL_BEFORE
                : MapResult::DEL_ACROSS;
            if (assoc < 0 ? pos != start : pos != end) {
                result.delInfo |= MapResult::DEL_SIDE;
            }
            return result;
        }
        diff += newSize - oldSize;
    }

    MapResult result{};
    result.pos = pos + diff;
    return result;
}

std::int64_t StepMap::map(std::int64_t pos, int assoc) const {
    return mapResult(pos, assoc).pos;
}

StepMap StepMap::invert() const {
    return StepMap(ranges_, !inverted_);
}

MapResult PositionTransform::mapResult(std::int64_t pos, int assoc) const {
    MapResult result{};
    result.pos = pos;
    for (const StepMap& stepMap : maps) {
        const MapResult step = stepMap.mapResult(result.pos, assoc);
        result.pos = step.pos;
        result.delInfo |= step.delInfo;
        if (step.deleted()) break;
    }
    return result;
}

std::int64_t PositionTransform::map(std::int64_t pos, int assoc) const {
    std::int64_t mapped = pos;
    for (const StepMap& stepMap : maps) {
        mapped = stepMap.map(mapped, assoc);
    }
    return mapped;
}

} // namespace reflow::epoch
