#ifndef REFLOW_EPOCH_STEP_MAP_H
#define REFLOW_EPOCH_STEP_MAP_H

#include <cstdint>
#include <vector>

namespace reflow::epoch {

// Result of mapping one position through a StepMap.
struct MapResult {
    static constexpr std::uint32_t DEL_BEFORE = 1;
    static constexpr std::uint32_t DEL_AFTER = 2;
    static constexpr std::uint32_t DEL_ACROSS = 4;
    static constexpr std::uint32_t DEL_SIDE = 8;

    std::int64_t pos = 0;
    std::uint32_t delInfo = 0;

    // The content on the side the position associates with was removed
    bool deleted() const { return (delInfo & DEL_SIDE) != 0; }
    bool deletedBefore() const { return (delInfo & (DEL_BEFORE | DEL_ACROSS)) != 0; }
    bool deletedAfter() const { return (delInfo & (DEL_AFTER | DEL_ACROSS)) != 0; }
    bool deletedAcross() const { return (delInfo & DEL_ACROSS) != 0; }
};

/**
 * StepMap: Positional effect of one edit step.
 *
 * Stored as flat triples (start, oldSize, newSize) sorted by start, with
 * starts expressed in pre-step coordinates.
 */
class StepMap {
public:
    StepMap() = default;
    explicit StepMap(std::vector<std::int64_t> ranges, bool inverted = false);

    static StepMap insertion(std::int64_t at, std::int64_t size);
    static StepMap deletion(std::int64_t from, std::int64_t to);
    static StepMap replacement(std::int64_t from, std::int64_t to, std::int64_t newSize);

    /**
     * A map that shifts every position by n (insertion or deletion at 0).
     */
    static StepMap offset(std::int64_t n);

    /**
     * Map a position, reporting deletion.
     * @param assoc Side to bind to at an insertion point: -1 left, 1 right
     */
    MapResult mapResult(std::int64_t pos, int assoc = 1) const;

    std::int64_t map(std::int64_t pos, int assoc = 1) const;

    /**
     * The map of the inverse step (swaps old and new sizes).
     */
    StepMap invert() const;

    bool empty() const { return ranges_.empty(); }
    const std::vector<std::int64_t>& ranges() const { return ranges_; }

private:
    std::vector<std::int64_t> ranges_;
    bool inverted_ = false;
};

/**
 * PositionTransform: The ordered step maps of one edit.
 */
struct PositionTransform {
    std::vector<StepMap> maps;

    /**
     * Replay every step. Stops at the first step that deletes the position;
     * the returned result then reports deleted().
     */
    MapResult mapResult(std::int64_t pos, int assoc = 1) const;

    std::int64_t map(std::int64_t pos, int assoc = 1) const;

    bool empty() const { return maps.empty(); }
};

// What an edit source hands to the epoch tracker for each transaction.
struct EditRecord {
    bool docChanged = false;
    PositionTransform transform;
};

} // namespace reflow::epoch

#endif // REFLOW_EPOCH_STEP_MAP_H
