#include "reflow/session/layout_session.h"

#include "reflow/core/logging.h"

namespace reflow::session {

LayoutSession::LayoutSession(selection::FrameScheduler& scheduler)
    : LayoutSession(scheduler, epoch::EpochPositionMapper::Options{}) {}

LayoutSession::LayoutSession(
    selection::FrameScheduler& scheduler,
    const epoch::EpochPositionMapper::Options& options
)
    : mapper_(options), coordinator_(scheduler) {}

epoch::Epoch LayoutSession::applyEdit(const epoch::EditRecord& edit) {
    mapper_.recordTransaction(edit);
    tracker_.applyEdit(edit);
    const epoch::Epoch current = mapper_.getCurrentEpoch();
    coordinator_.setDocEpoch(current);
    return current;
}

epoch::Epoch LayoutSession::beginLayout() {
    coordinator_.onLayoutStart();
    return mapper_.getCurrentEpoch();
}

void LayoutSession::completeLayout(epoch::Epoch layoutEpoch) {
    mapper_.onLayoutComplete(layoutEpoch);
    coordinator_.onLayoutComplete(layoutEpoch);
}

void LayoutSession::abortLayout() {
    coordinator_.onLayoutAbort();
}

epoch::MapPosResult LayoutSession::mapLayoutPos(std::int64_t pos, epoch::Epoch layoutEpoch, int assoc) const {
    const epoch::MapPosResult result = mapper_.mapPosFromLayoutToCurrentDetailed(pos, layoutEpoch, assoc);
    if (result.ok) return result;

    switch (result.reason) {
        case epoch::MapPosFailureReason::InvalidPos:
        case epoch::MapPosFailureReason::InvalidEpoch:
            REFLOW_LOG_WARN("mapLayoutPos(%lld, %lld): %s",
                static_cast<long long>(pos), static_cast<long long>(layoutEpoch),
                epoch::toString(result.reason));
            break;
        case epoch::MapPosFailureReason::EpochTooOld:
        case epoch::MapPosFailureReason::Deleted:
            REFLOW_LOG_DEBUG("mapLayoutPos(%lld, %lld): %s",
                static_cast<long long>(pos), static_cast<long long>(layoutEpoch),
                epoch::toString(result.reason));
            break;
        case epoch::MapPosFailureReason::MissingStepMap:
        case epoch::MapPosFailureReason::None:
            // Already reported by the mapper
            break;
    }
    return result;
}

} // namespace reflow::session
