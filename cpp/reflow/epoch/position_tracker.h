#ifndef REFLOW_EPOCH_POSITION_TRACKER_H
#define REFLOW_EPOCH_POSITION_TRACKER_H

#include "reflow/epoch/step_map.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reflow::epoch {

using TrackedId = std::uint32_t;

enum class TrackedKind : std::uint8_t {
    Range = 0,
    Point = 1,
};

struct TrackedRangeSpec {
    std::string type;
    TrackedKind kind = TrackedKind::Range;
    bool inclusiveStart = false; // Content inserted at `from` joins the range
    bool inclusiveEnd = false;   // Content inserted at `to` joins the range
};

struct ResolvedRange {
    TrackedId id = 0;
    std::int64_t from = 0;
    std::int64_t to = 0;
    TrackedRangeSpec spec;
};

struct TrackRequest {
    std::int64_t from = 0;
    std::int64_t to = 0;
    TrackedRangeSpec spec;
};

/**
 * PositionTracker: Keeps document ranges and points valid across edits.
 *
 * Responsibilities:
 * - Assign ids to tracked ranges and points
 * - Map every tracked entry through each content-changing edit
 * - Drop entries whose content was removed
 *
 * Ids are never reused. Id 0 means "not tracked".
 */
class PositionTracker {
public:
    PositionTracker() = default;

    /**
     * Start tracking a range (or a point, when spec.kind is Point).
     * @return New id, or 0 if from/to are negative or from > to
     */
    TrackedId track(std::int64_t from, std::int64_t to, const TrackedRangeSpec& spec);

    /**
     * Track several ranges at once. Rejected entries get id 0 at their index.
     */
    std::vector<TrackedId> trackMany(const std::vector<TrackRequest>& requests);

    /**
     * @return True if the id was tracked
     */
    bool untrack(TrackedId id);
    std::size_t untrackMany(const std::vector<TrackedId>& ids);
    std::size_t untrackByType(const std::string& type);

    std::optional<ResolvedRange> resolve(TrackedId id) const;
    std::unordered_map<TrackedId, std::optional<ResolvedRange>> resolveMany(const std::vector<TrackedId>& ids) const;

    /**
     * All entries of a type, ordered by id.
     */
    std::vector<ResolvedRange> findByType(const std::string& type) const;

    /**
     * Map every entry through an edit. No-op unless edit.docChanged.
     */
    void applyEdit(const EditRecord& edit);

    std::uint64_t generation() const noexcept { return generation_; }
    std::size_t size() const noexcept { return entries_.size(); }

private:
    struct Entry {
        std::int64_t from = 0;
        std::int64_t to = 0;
        TrackedRangeSpec spec;
    };

    static ResolvedRange toResolved(TrackedId id, const Entry& entry);
    static bool mapEntry(Entry& entry, const PositionTransform& transform);

    std::unordered_map<TrackedId, Entry> entries_;
    TrackedId nextId_ = 1;
    std::uint64_t generation_ = 0;
};

} // namespace reflow::epoch

#endif // REFLOW_EPOCH_POSITION_TRACKER_H
