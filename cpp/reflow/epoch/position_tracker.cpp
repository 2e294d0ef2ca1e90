#include "reflow/epoch/position_tracker.h"

#include "reflow/core/logging.h"

#include <algorithm>
#include <utility>

namespace reflow::epoch {

TrackedId PositionTracker::track(std::int64_t from, std::int64_t to, const TrackedRangeSpec& spec) {
    if (from < 0 || to < 0 || from > to) {
        REFLOW_LOG_DEBUG("PositionTracker: rejected range [%lld, %lld]",
            static_cast<long long>(from), static_cast<long long>(to));
        return 0;
    }

    Entry entry;
    entry.from = from;
    entry.to = spec.kind == TrackedKind::Point ? from : to;
    entry.spec = spec;

    const TrackedId id = nextId_++;
    entries_.emplace(id, std::move(entry));
    return id;
}

std::vector<TrackedId> PositionTracker::trackMany(const std::vector<TrackRequest>& requests) {
    std::vector<TrackedId> ids;
    ids.reserve(requests.size());
    for (const TrackRequest& request : requests) {
        ids.push_back(track(request.from, request.to, request.spec));
    }
    return ids;
}

bool PositionTracker::untrack(TrackedId id) {
    return entries_.erase(id) > 0;
}

std::size_t PositionTracker::untrackMany(const std::vector<TrackedId>& ids) {
    std::size_t removed = 0;
    for (TrackedId id : ids) {
        removed += entries_.erase(id);
    }
    return removed;
}

std::size_t PositionTracker::untrackByType(const std::string& type) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.spec.type == type) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<ResolvedRange> PositionTracker::resolve(TrackedId id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return toResolved(it->first, it->second);
}

std::unordered_map<TrackedId, std::optional<ResolvedRange>> PositionTracker::resolveMany(
    const std::vector<TrackedId>& ids
) const {
    std::unordered_map<TrackedId, std::optional<ResolvedRange>> result;
    result.reserve(ids.size());
    for (TrackedId id : ids) {
        result[id] = resolve(id);
    }
    return result;
}

std::vector<ResolvedRange> PositionTracker::findByType(const std::string& type) const {
    std::vector<ResolvedRange> result;
    for (const auto& [id, entry] : entries_) {
        if (entry.spec.type == type) {
            result.push_back(toResolved(id, entry));
        }
    }
    std::sort(result.begin(), result.end(),
        [](const ResolvedRange& a, const ResolvedRange& b) { return a.id < b.id; });
    return result;
}

void PositionTracker::applyEdit(const EditRecord& edit) {
    if (!edit.docChanged) return;

    std::size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (mapEntry(it->second, edit.transform)) {
            ++it;
        } else {
            it = entries_.erase(it);
            ++dropped;
        }
    }
    generation_ += 1;

    if (dropped > 0) {
        REFLOW_LOG_DEBUG("PositionTracker: dropped %zu entries at generation %llu",
            dropped, static_cast<unsigned long long>(generation_));
    }
}

ResolvedRange PositionTracker::toResolved(TrackedId id, const Entry& entry) {
    ResolvedRange resolved;
    resolved.id = id;
    resolved.from = entry.from;
    resolved.to = entry.to;
    resolved.spec = entry.spec;
    return resolved;
}

bool PositionTracker::mapEntry(Entry& entry, const PositionTransform& transform) {
    if (entry.spec.kind == TrackedKind::Point) {
        const MapResult mapped = transform.mapResult(entry.from, 1);
        if (mapped.deleted()) return false;
        entry.from = mapped.pos;
        entry.to = mapped.pos;
        return true;
    }

    const std::int64_t from = transform.map(entry.from, entry.spec.inclusiveStart ? -1 : 1);
    const std::int64_t to = transform.map(entry.to, entry.spec.inclusiveEnd ? 1 : -1);
    if (from >= to) return false;
    entry.from = from;
    entry.to = to;
    return true;
}

} // namespace reflow::epoch
