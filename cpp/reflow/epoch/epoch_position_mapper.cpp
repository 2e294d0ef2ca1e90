#include "reflow/epoch/epoch_position_mapper.h"

#include "reflow/core/logging.h"

#include <algorithm>
#include <utility>

namespace reflow::epoch {

const char* toString(MapPosFailureReason reason) {
    switch (reason) {
        case MapPosFailureReason::None: return "none";
        case MapPosFailureReason::InvalidEpoch: return "invalid_epoch";
        case MapPosFailureReason::EpochTooOld: return "epoch_too_old";
        case MapPosFailureReason::MissingStepMap: return "missing_stepmap";
        case MapPosFailureReason::Deleted: return "deleted";
        case MapPosFailureReason::InvalidPos: return "invalid_pos";
    }
    return "unknown";
}

EpochPositionMapper::EpochPositionMapper()
    : EpochPositionMapper(Options{}) {}

EpochPositionMapper::EpochPositionMapper(const Options& options)
    : maxEpochsToKeep_(std::max<std::int64_t>(1, options.maxEpochsToKeep)) {}

void EpochPositionMapper::recordTransaction(const EditRecord& edit) {
    if (!edit.docChanged) return;
    transformsByFromEpoch_[currentEpoch_] = edit.transform;
    currentEpoch_ += 1;
    pruneByCurrentEpoch();
}

void EpochPositionMapper::recordTransaction(EditRecord&& edit) {
    if (!edit.docChanged) return;
    transformsByFromEpoch_[currentEpoch_] = std::move(edit.transform);
    currentEpoch_ += 1;
    pruneByCurrentEpoch();
}

void EpochPositionMapper::onLayoutComplete(Epoch layoutEpoch) {
    // Painted positions never come from an epoch older than the painted layout
    transformsByFromEpoch_.erase(
        transformsByFromEpoch_.begin(),
        transformsByFromEpoch_.lower_bound(layoutEpoch));
    pruneByCurrentEpoch();
}

MapPosResult EpochPositionMapper::mapPosFromLayoutToCurrentDetailed(
    std::int64_t pos,
    Epoch fromEpoch,
    int assoc
) const {
    MapPosResult result{};
    result.fromEpoch = fromEpoch;
    result.toEpoch = currentEpoch_;

    if (pos < 0) {
        result.reason = MapPosFailureReason::InvalidPos;
        return result;
    }
    if (fromEpoch < 0 || fromEpoch > currentEpoch_) {
        result.reason = MapPosFailureReason::InvalidEpoch;
        return result;
    }
    if (fromEpoch == currentEpoch_) {
        result.ok = true;
        result.pos = pos;
        return result;
    }
    if (fromEpoch < minKeptFromEpoch()) {
        result.reason = MapPosFailureReason::EpochTooOld;
        return result;
    }

    std::int64_t mapped = pos;
    for (Epoch epoch = fromEpoch; epoch < currentEpoch_; ++epoch) {
        auto it = transformsByFromEpoch_.find(epoch);
        if (it == transformsByFromEpoch_.end()) {
            ++missingStepMapCount_;
            REFLOW_LOG_WARN("missing transform for epoch %lld (mapping %lld -> %lld)",
                static_cast<long long>(epoch),
                static_cast<long long>(fromEpoch),
                static_cast<long long>(currentEpoch_));
            result.reason = MapPosFailureReason::MissingStepMap;
            return result;
        }
        const MapResult step = it->second.mapResult(mapped, assoc);
        if (step.deleted()) {
            result.reason = MapPosFailureReason::Deleted;
            return result;
        }
        mapped = step.pos;
    }

    result.ok = true;
    result.pos = mapped;
    return result;
}

std::optional<std::int64_t> EpochPositionMapper::mapPosFromLayoutToCurrent(
    std::int64_t pos,
    Epoch fromEpoch,
    int assoc
) const {
    const MapPosResult result = mapPosFromLayoutToCurrentDetailed(pos, fromEpoch, assoc);
    if (!result.ok) return std::nullopt;
    return result.pos;
}

Epoch EpochPositionMapper::oldestRetainedEpoch() const noexcept {
    return transformsByFromEpoch_.empty() ? currentEpoch_ : transformsByFromEpoch_.begin()->first;
}

void EpochPositionMapper::pruneByCurrentEpoch() {
    transformsByFromEpoch_.erase(
        transformsByFromEpoch_.begin(),
        transformsByFromEpoch_.lower_bound(minKeptFromEpoch()));
}

Epoch EpochPositionMapper::minKeptFromEpoch() const noexcept {
    return std::max<Epoch>(0, currentEpoch_ - maxEpochsToKeep_);
}

} // namespace reflow::epoch
