#include "reflow/selection/frame_scheduler.h"

#include <algorithm>
#include <utility>

namespace reflow::selection {

FrameHandle TaskQueueScheduler::schedule(std::function<void()> callback) {
    const FrameHandle handle = nextHandle_++;
    if (nextHandle_ == 0) nextHandle_ = 1;
    queue_.push_back(Task{handle, nextSequence_++, std::move(callback)});
    return handle;
}

void TaskQueueScheduler::cancel(FrameHandle handle) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
        [handle](const Task& task) { return task.handle == handle; });
    if (it != queue_.end()) {
        queue_.erase(it);
    }
}

std::size_t TaskQueueScheduler::runPending() {
    if (queue_.empty()) return 0;

    // Only tasks up to the current tail run in this pass
    const std::uint64_t last = queue_.back().sequence;
    std::size_t ran = 0;
    while (!queue_.empty() && queue_.front().sequence <= last) {
        Task task = std::move(queue_.front());
        queue_.pop_front();
        if (task.callback) {
            task.callback();
            ++ran;
        }
    }
    return ran;
}

} // namespace reflow::selection
