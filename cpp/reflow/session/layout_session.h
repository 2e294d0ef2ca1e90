#ifndef REFLOW_SESSION_LAYOUT_SESSION_H
#define REFLOW_SESSION_LAYOUT_SESSION_H

#include "reflow/epoch/epoch_position_mapper.h"
#include "reflow/epoch/position_tracker.h"
#include "reflow/selection/frame_scheduler.h"
#include "reflow/selection/selection_sync_coordinator.h"

#include <cstdint>

namespace reflow::session {

/**
 * LayoutSession: Per-document wiring of epoch mapping, tracked positions and
 * render gating.
 *
 * Edits go to the mapper and tracker before the coordinator hears about the
 * new epoch. One session per open document; nothing is shared between
 * sessions.
 */
class LayoutSession {
public:
    explicit LayoutSession(selection::FrameScheduler& scheduler);
    LayoutSession(selection::FrameScheduler& scheduler, const epoch::EpochPositionMapper::Options& options);

    // Non-copyable
    LayoutSession(const LayoutSession&) = delete;
    LayoutSession& operator=(const LayoutSession&) = delete;

    /**
     * Record an edit.
     * @return Document epoch after the edit
     */
    epoch::Epoch applyEdit(const epoch::EditRecord& edit);

    /**
     * Layout computation is starting.
     * @return Epoch the layout should be computed against
     */
    epoch::Epoch beginLayout();

    /**
     * A layout computed against layoutEpoch has been painted.
     */
    void completeLayout(epoch::Epoch layoutEpoch);

    void abortLayout();

    /**
     * Map a position read from painted geometry to the current document.
     */
    epoch::MapPosResult mapLayoutPos(std::int64_t pos, epoch::Epoch layoutEpoch, int assoc = 1) const;

    epoch::Epoch currentEpoch() const noexcept { return mapper_.getCurrentEpoch(); }

    epoch::EpochPositionMapper& mapper() { return mapper_; }
    const epoch::EpochPositionMapper& mapper() const { return mapper_; }
    epoch::PositionTracker& tracker() { return tracker_; }
    const epoch::PositionTracker& tracker() const { return tracker_; }
    selection::SelectionSyncCoordinator& coordinator() { return coordinator_; }
    const selection::SelectionSyncCoordinator& coordinator() const { return coordinator_; }

private:
    epoch::EpochPositionMapper mapper_;
    epoch::PositionTracker tracker_;
    selection::SelectionSyncCoordinator coordinator_;
};

} // namespace reflow::session

#endif // REFLOW_SESSION_LAYOUT_SESSION_H
