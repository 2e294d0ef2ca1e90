#ifndef REFLOW_SELECTION_FRAME_SCHEDULER_H
#define REFLOW_SELECTION_FRAME_SCHEDULER_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>

namespace reflow::selection {

// Non-zero for a scheduled callback.
using FrameHandle = std::uint32_t;

/**
 * FrameScheduler: Runs a callback once, at the host's next frame.
 */
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    virtual FrameHandle schedule(std::function<void()> callback) = 0;

    /**
     * Cancel a scheduled callback. Unknown or already-run handles are ignored.
     */
    virtual void cancel(FrameHandle handle) = 0;
};

/**
 * TaskQueueScheduler: FIFO scheduler drained explicitly by the host loop.
 */
class TaskQueueScheduler : public FrameScheduler {
public:
    TaskQueueScheduler() = default;

    // Non-copyable
    TaskQueueScheduler(const TaskQueueScheduler&) = delete;
    TaskQueueScheduler& operator=(const TaskQueueScheduler&) = delete;

    FrameHandle schedule(std::function<void()> callback) override;
    void cancel(FrameHandle handle) override;

    /**
     * Run the callbacks queued before this call, in order. Callbacks
     * scheduled while running wait for the next call.
     * @return Number of callbacks run
     */
    std::size_t runPending();

    std::size_t pendingCount() const noexcept { return queue_.size(); }
    bool hasPending() const noexcept { return !queue_.empty(); }

private:
    struct Task {
        FrameHandle handle;
        std::uint64_t sequence;
        std::function<void()> callback;
    };

    std::deque<Task> queue_;
    FrameHandle nextHandle_ = 1;
    std::uint64_t nextSequence_ = 0;
};

} // namespace reflow::selection

#endif // REFLOW_SELECTION_FRAME_SCHEDULER_H
