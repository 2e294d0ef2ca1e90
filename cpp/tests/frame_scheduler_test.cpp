#include <gtest/gtest.h>
#include "reflow/selection/frame_scheduler.h"
#include <vector>

using namespace reflow::selection;

TEST(FrameSchedulerTest, RunsInFifoOrder) {
    TaskQueueScheduler scheduler;
    std::vector<int> order;

    scheduler.schedule([&]() { order.push_back(1); });
    scheduler.schedule([&]() { order.push_back(2); });
    EXPECT_EQ(scheduler.pendingCount(), 2u);

    EXPECT_EQ(scheduler.runPending(), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_FALSE(scheduler.hasPending());
}

TEST(FrameSchedulerTest, HandlesAreNonZeroAndDistinct) {
    TaskQueueScheduler scheduler;
    const FrameHandle a = scheduler.schedule([]() {});
    const FrameHandle b = scheduler.schedule([]() {});
    EXPECT_NE(a, 0u);
    EXPECT_NE(b, 0u);
    EXPECT_NE(a, b);
}

TEST(FrameSchedulerTest, CancelledCallbacksNeverRun) {
    TaskQueueScheduler scheduler;
    int runs = 0;
    const FrameHandle handle = scheduler.schedule([&]() { ++runs; });
    scheduler.schedule([&]() { runs += 10; });

    scheduler.cancel(handle);
    scheduler.cancel(handle);
    scheduler.cancel(12345);

    EXPECT_EQ(scheduler.runPending(), 1u);
    EXPECT_EQ(runs, 10);
}

TEST(FrameSchedulerTest, CallbacksScheduledWhileRunningWait) {
    TaskQueueScheduler scheduler;
    int nested = 0;
    scheduler.schedule([&]() {
        scheduler.schedule([&]() { ++nested; });
    });

    EXPECT_EQ(scheduler.runPending(), 1u);
    EXPECT_EQ(nested, 0);
    EXPECT_EQ(scheduler.pendingCount(), 1u);

    EXPECT_EQ(scheduler.runPending(), 1u);
    EXPECT_EQ(nested, 1);
}

TEST(FrameSchedulerTest, CallbackCanCancelLaterTask) {
    TaskQueueScheduler scheduler;
    int runs = 0;
    FrameHandle second = 0;
    scheduler.schedule([&]() { scheduler.cancel(second); });
    second = scheduler.schedule([&]() { ++runs; });
    scheduler.schedule([&]() { runs += 10; });

    EXPECT_EQ(scheduler.runPending(), 2u);
    EXPECT_EQ(runs, 10);
}
