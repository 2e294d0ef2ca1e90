#include "reflow/selection/selection_sync_coordinator.h"

#include "reflow/core/logging.h"

#include <algorithm>
#include <utility>

namespace reflow::selection {

SelectionSyncCoordinator::SelectionSyncCoordinator(FrameScheduler& scheduler)
    : scheduler_(scheduler) {}

SelectionSyncCoordinator::~SelectionSyncCoordinator() {
    cancelScheduledRender();
}

ListenerId SelectionSyncCoordinator::onRender(RenderListener listener) {
    const ListenerId id = nextListenerId_++;
    listeners_.push_back(ListenerEntry{id, std::move(listener)});
    return id;
}

bool SelectionSyncCoordinator::removeListener(ListenerId id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
        [id](const ListenerEntry& entry) { return entry.id == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void SelectionSyncCoordinator::removeAllListeners() {
    listeners_.clear();
}

void SelectionSyncCoordinator::setDocEpoch(std::int64_t epoch) {
    if (epoch < 0) {
        REFLOW_LOG_DEBUG("SelectionSyncCoordinator: ignoring doc epoch %lld", static_cast<long long>(epoch));
        return;
    }
    if (epoch == docEpoch_) return;
    docEpoch_ = epoch;
    cancelScheduledRender();
    maybeSchedule();
}

void SelectionSyncCoordinator::onLayoutStart() {
    if (layoutUpdating_) return;
    layoutUpdating_ = true;
    cancelScheduledRender();
}

void SelectionSyncCoordinator::onLayoutComplete(std::int64_t layoutEpoch) {
    layoutUpdating_ = false;
    if (layoutEpoch >= 0) {
        layoutEpoch_ = layoutEpoch;
    } else {
        REFLOW_LOG_DEBUG("SelectionSyncCoordinator: ignoring layout epoch %lld", static_cast<long long>(layoutEpoch));
    }
    maybeSchedule();
}

void SelectionSyncCoordinator::onLayoutAbort() {
    layoutUpdating_ = false;
    maybeSchedule();
}

void SelectionSyncCoordinator::requestRender(const RenderRequestOptions& options) {
    pending_ = true;
    if (options.immediate) {
        flushNow();
    }
    maybeSchedule();
}

void SelectionSyncCoordinator::flushNow() {
    if (!pending_) return;
    if (!isSafeToRender()) return;

    cancelScheduledRender();
    pending_ = false;
    emitRender();
}

void SelectionSyncCoordinator::destroy() {
    cancelScheduledRender();
    removeAllListeners();
}

void SelectionSyncCoordinator::maybeSchedule() {
    if (!pending_) return;
    if (!isSafeToRender()) return;
    if (scheduled_) return;

    scheduled_ = true;
    frameHandle_ = scheduler_.schedule([this]() { onScheduledFrame(); });
}

void SelectionSyncCoordinator::onScheduledFrame() {
    scheduled_ = false;
    frameHandle_ = 0;

    // State may have changed while queued
    if (!pending_) return;
    if (!isSafeToRender()) return;

    pending_ = false;
    emitRender();
}

void SelectionSyncCoordinator::cancelScheduledRender() {
    if (frameHandle_ != 0) {
        scheduler_.cancel(frameHandle_);
        frameHandle_ = 0;
    }
    scheduled_ = false;
}

void SelectionSyncCoordinator::emitRender() {
    const RenderPayload payload{docEpoch_, layoutEpoch_};
    // Listeners may add or remove listeners while being notified
    const std::vector<ListenerEntry> snapshot = listeners_;
    for (const ListenerEntry& entry : snapshot) {
        if (entry.callback) entry.callback(payload);
    }
}

} // namespace reflow::selection
