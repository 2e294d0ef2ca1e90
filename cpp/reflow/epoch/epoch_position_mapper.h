#ifndef REFLOW_EPOCH_EPOCH_POSITION_MAPPER_H
#define REFLOW_EPOCH_EPOCH_POSITION_MAPPER_H

#include "reflow/core/constants.h"
#include "reflow/epoch/step_map.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>

namespace reflow::epoch {

// Document version. Starts at 0, +1 per content-changing edit.
using Epoch = std::int64_t;

enum class MapPosFailureReason : std::uint8_t {
    None = 0,
    InvalidEpoch = 1,   // fromEpoch negative or ahead of the current epoch
    EpochTooOld = 2,    // fromEpoch is outside the retention window
    MissingStepMap = 3, // Retention bookkeeping gap, a defect signal
    Deleted = 4,        // The position's content was removed
    InvalidPos = 5,     // Negative position
};

const char* toString(MapPosFailureReason reason);

struct MapPosResult {
    bool ok = false;
    std::int64_t pos = 0;                                  // Valid when ok
    MapPosFailureReason reason = MapPosFailureReason::None; // Valid when !ok
    Epoch fromEpoch = 0;
    Epoch toEpoch = 0;
};

/**
 * EpochPositionMapper: Maps positions from past document epochs to the current one.
 *
 * Layout is painted asynchronously, so painted geometry is tagged with the
 * epoch it was computed against. This keeps a sliding window of each edit's
 * PositionTransform and replays them to bring such positions forward.
 *
 * Transforms are pruned by age (maxEpochsToKeep) and by layout completion
 * (nothing older than the last painted epoch is needed again).
 */
class EpochPositionMapper {
public:
    struct Options {
        std::int64_t maxEpochsToKeep = constants::DEFAULT_MAX_EPOCHS_TO_KEEP;
    };

    EpochPositionMapper();
    explicit EpochPositionMapper(const Options& options);

    Epoch getCurrentEpoch() const noexcept { return currentEpoch_; }
    std::int64_t maxEpochsToKeep() const noexcept { return maxEpochsToKeep_; }

    /**
     * Record an edit. Edits that did not change the document are ignored and
     * do not advance the epoch.
     */
    void recordTransaction(const EditRecord& edit);
    void recordTransaction(EditRecord&& edit);

    /**
     * Drop transforms older than a painted layout's epoch. Idempotent.
     */
    void onLayoutComplete(Epoch layoutEpoch);

    /**
     * Map a position from fromEpoch to the current epoch.
     * @param assoc Side to bind to at insertion points: -1 left, 1 right
     */
    MapPosResult mapPosFromLayoutToCurrentDetailed(std::int64_t pos, Epoch fromEpoch, int assoc = 1) const;

    /**
     * Same as the detailed variant, without the failure reason.
     */
    std::optional<std::int64_t> mapPosFromLayoutToCurrent(std::int64_t pos, Epoch fromEpoch, int assoc = 1) const;

    std::size_t retainedEpochCount() const noexcept { return transformsByFromEpoch_.size(); }

    /**
     * Oldest fromEpoch with a retained transform, or the current epoch if none.
     */
    Epoch oldestRetainedEpoch() const noexcept;

    /**
     * Number of mapping attempts that hit a missing transform inside the window.
     */
    std::uint64_t missingStepMapCount() const noexcept { return missingStepMapCount_; }

private:
    void pruneByCurrentEpoch();
    Epoch minKeptFromEpoch() const noexcept;

    Epoch currentEpoch_ = 0;
    std::int64_t maxEpochsToKeep_ = constants::DEFAULT_MAX_EPOCHS_TO_KEEP;
    std::map<Epoch, PositionTransform> transformsByFromEpoch_;
    mutable std::uint64_t missingStepMapCount_ = 0;
};

} // namespace reflow::epoch

#endif // REFLOW_EPOCH_EPOCH_POSITION_MAPPER_H
