#ifndef REFLOW_SELECTION_SELECTION_SYNC_COORDINATOR_H
#define REFLOW_SELECTION_SELECTION_SYNC_COORDINATOR_H

#include "reflow/selection/frame_scheduler.h"

#include <cstdint>
#include <functional>
#include <vector>

namespace reflow::selection {

struct RenderPayload {
    std::int64_t docEpoch = 0;    // Document epoch at render time
    std::int64_t layoutEpoch = 0; // Epoch of the painted layout
};

inline bool operator==(const RenderPayload& a, const RenderPayload& b) {
    return a.docEpoch == b.docEpoch && a.layoutEpoch == b.layoutEpoch;
}

using RenderListener = std::function<void(const RenderPayload&)>;
using ListenerId = std::uint32_t;

struct RenderRequestOptions {
    bool immediate = false; // Try a synchronous flush before scheduling
};

/**
 * SelectionSyncCoordinator: Gates selection rendering on layout catching up.
 *
 * Tracks the document epoch and the painted layout epoch. Rendering is safe
 * when no layout is in progress and layoutEpoch >= docEpoch. Render requests
 * are coalesced into at most one scheduled callback.
 *
 * Lifecycle per edit/layout:
 * 1. setDocEpoch() after each document change
 * 2. onLayoutStart() / onLayoutComplete() (or onLayoutAbort()) around layout
 * 3. requestRender() when the selection changes
 * 4. Render listeners fire once it is safe
 */
class SelectionSyncCoordinator {
public:
    explicit SelectionSyncCoordinator(FrameScheduler& scheduler);
    ~SelectionSyncCoordinator();

    // Non-copyable (scheduled callbacks capture this)
    SelectionSyncCoordinator(const SelectionSyncCoordinator&) = delete;
    SelectionSyncCoordinator& operator=(const SelectionSyncCoordinator&) = delete;

    // ==========================================================================
    // Observers
    // ==========================================================================

    ListenerId onRender(RenderListener listener);

    /**
     * @return True if the listener was registered
     */
    bool removeListener(ListenerId id);
    void removeAllListeners();
    std::size_t listenerCount() const noexcept { return listeners_.size(); }

    // ==========================================================================
    // Epoch / layout lifecycle
    // ==========================================================================

    /**
     * Update the document epoch. Negative or unchanged values are ignored.
     * Cancels any scheduled render, then re-attempts scheduling.
     */
    void setDocEpoch(std::int64_t epoch);

    /**
     * Mark layout as in progress and cancel any scheduled render.
     * Repeated calls before completion are ignored.
     */
    void onLayoutStart();

    /**
     * Mark layout as done. A negative layoutEpoch keeps the previous value.
     */
    void onLayoutComplete(std::int64_t layoutEpoch);

    /**
     * Mark layout as no longer running without changing the layout epoch.
     */
    void onLayoutAbort();

    // ==========================================================================
    // Rendering
    // ==========================================================================

    void requestRender(const RenderRequestOptions& options = {});

    /**
     * Emit synchronously if a render is pending and it is safe to render.
     */
    void flushNow();

    /**
     * Cancel any scheduled render and detach all listeners. Safe to repeat.
     */
    void destroy();

    std::int64_t getDocEpoch() const noexcept { return docEpoch_; }
    std::int64_t getLayoutEpoch() const noexcept { return layoutEpoch_; }
    bool isLayoutUpdating() const noexcept { return layoutUpdating_; }
    bool isSafeToRender() const noexcept { return !layoutUpdating_ && layoutEpoch_ >= docEpoch_; }
    bool hasPendingRender() const noexcept { return pending_; }
    bool isScheduled() const noexcept { return scheduled_; }

private:
    struct ListenerEntry {
        ListenerId id;
        RenderListener callback;
    };

    void maybeSchedule();
    void onScheduledFrame();
    void cancelScheduledRender();
    void emitRender();

    FrameScheduler& scheduler_;

    std::int64_t docEpoch_ = 0;
    std::int64_t layoutEpoch_ = 0;
    bool layoutUpdating_ = false;

    bool pending_ = false;
    bool scheduled_ = false;
    FrameHandle frameHandle_ = 0;

    std::vector<ListenerEntry> listeners_;
    ListenerId nextListenerId_ = 1;
};

} // namespace reflow::selection

#endif // REFLOW_SELECTION_SELECTION_SYNC_COORDINATOR_H
