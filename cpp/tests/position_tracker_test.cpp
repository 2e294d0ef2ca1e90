#include <gtest/gtest.h>
#include "reflow/epoch/position_tracker.h"
#include "tests/reflow_test_common.h"

using namespace reflow::epoch;
using reflow_test::editOfRanges;
using reflow_test::noopEdit;

namespace {

TrackedRangeSpec rangeSpec(const std::string& type, bool inclusiveStart = false, bool inclusiveEnd = false) {
    TrackedRangeSpec spec;
    spec.type = type;
    spec.kind = TrackedKind::Range;
    spec.inclusiveStart = inclusiveStart;
    spec.inclusiveEnd = inclusiveEnd;
    return spec;
}

TrackedRangeSpec pointSpec(const std::string& type) {
    TrackedRangeSpec spec;
    spec.type = type;
    spec.kind = TrackedKind::Point;
    return spec;
}

} // namespace

class PositionTrackerTest : public ::testing::Test {
protected:
    PositionTracker tracker;
};

TEST_F(PositionTrackerTest, TrackAndResolve) {
    const TrackedId id = tracker.track(2, 6, rangeSpec("comment"));
    ASSERT_NE(id, 0u);

    const auto resolved = tracker.resolve(id);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->id, id);
    EXPECT_EQ(resolved->from, 2);
    EXPECT_EQ(resolved->to, 6);
    EXPECT_EQ(resolved->spec.type, "comment");
    EXPECT_EQ(tracker.generation(), 0u);
}

TEST_F(PositionTrackerTest, RejectsInvalidRanges) {
    EXPECT_EQ(tracker.track(6, 2, rangeSpec("comment")), 0u);
    EXPECT_EQ(tracker.track(-1, 2, rangeSpec("comment")), 0u);
    EXPECT_EQ(tracker.size(), 0u);
}

TEST_F(PositionTrackerTest, RangeShiftsWithEdits) {
    const TrackedId id = tracker.track(4, 8, rangeSpec("comment"));

    tracker.applyEdit(editOfRanges({0, 0, 3}));
    auto resolved = tracker.resolve(id);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->from, 7);
    EXPECT_EQ(resolved->to, 11);

    // Delete inside the range
    tracker.applyEdit(editOfRanges({8, 2, 0}));
    resolved = tracker.resolve(id);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->from, 7);
    EXPECT_EQ(resolved->to, 9);
    EXPECT_EQ(tracker.generation(), 2u);
}

TEST_F(PositionTrackerTest, InsertionsAtEdgesFollowInclusivity) {
    const TrackedId exclusive = tracker.track(4, 8, rangeSpec("exclusive"));
    const TrackedId inclusive = tracker.track(4, 8, rangeSpec("inclusive", true, true));

    tracker.applyEdit(editOfRanges({8, 0, 2}));
    EXPECT_EQ(tracker.resolve(exclusive)->to, 8);
    EXPECT_EQ(tracker.resolve(inclusive)->to, 10);

    tracker.applyEdit(editOfRanges({4, 0, 1}));
    EXPECT_EQ(tracker.resolve(exclusive)->from, 5);
    EXPECT_EQ(tracker.resolve(inclusive)->from, 4);
}

TEST_F(PositionTrackerTest, RangeDroppedWhenContentDeleted) {
    const TrackedId id = tracker.track(4, 8, rangeSpec("comment"));
    const TrackedId other = tracker.track(10, 12, rangeSpec("comment"));

    tracker.applyEdit(editOfRanges({3, 6, 0}));
    EXPECT_FALSE(tracker.resolve(id).has_value());
    ASSERT_TRUE(tracker.resolve(other).has_value());
    EXPECT_EQ(tracker.resolve(other)->from, 4);
}

TEST_F(PositionTrackerTest, PointsSurviveUnlessDeleted) {
    const TrackedId caret = tracker.track(5, 5, pointSpec("caret"));
    const TrackedId doomed = tracker.track(12, 12, pointSpec("caret"));

    tracker.applyEdit(editOfRanges({5, 0, 2}));
    EXPECT_EQ(tracker.resolve(caret)->from, 7);
    EXPECT_EQ(tracker.resolve(caret)->to, 7);

    tracker.applyEdit(editOfRanges({10, 5, 0}));
    EXPECT_TRUE(tracker.resolve(caret).has_value());
    EXPECT_FALSE(tracker.resolve(doomed).has_value());
}

TEST_F(PositionTrackerTest, NoopEditLeavesGenerationAlone) {
    tracker.track(1, 3, rangeSpec("comment"));
    tracker.applyEdit(noopEdit());
    EXPECT_EQ(tracker.generation(), 0u);
}

TEST_F(PositionTrackerTest, UntrackVariants) {
    const auto ids = tracker.trackMany({
        TrackRequest{0, 2, rangeSpec("comment")},
        TrackRequest{3, 5, rangeSpec("search")},
        TrackRequest{6, 8, rangeSpec("search")},
        TrackRequest{9, 1, rangeSpec("search")},
    });
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids[3], 0u);
    EXPECT_EQ(tracker.size(), 3u);

    EXPECT_EQ(tracker.findByType("search").size(), 2u);
    EXPECT_EQ(tracker.untrackByType("search"), 2u);
    EXPECT_TRUE(tracker.findByType("search").empty());

    EXPECT_TRUE(tracker.untrack(ids[0]));
    EXPECT_FALSE(tracker.untrack(ids[0]));
    EXPECT_EQ(tracker.untrackMany({ids[1], ids[2]}), 0u);
    EXPECT_EQ(tracker.size(), 0u);
}

TEST_F(PositionTrackerTest, ResolveManyReportsMissingIds) {
    const TrackedId a = tracker.track(0, 2, rangeSpec("comment"));
    const TrackedId b = tracker.track(4, 6, rangeSpec("comment"));
    tracker.untrack(b);

    const auto resolved = tracker.resolveMany({a, b, 99});
    ASSERT_EQ(resolved.size(), 3u);
    EXPECT_TRUE(resolved.at(a).has_value());
    EXPECT_FALSE(resolved.at(b).has_value());
    EXPECT_FALSE(resolved.at(99).has_value());
}

TEST_F(PositionTrackerTest, FindByTypeOrdersById) {
    const TrackedId first = tracker.track(10, 12, rangeSpec("search"));
    const TrackedId second = tracker.track(0, 2, rangeSpec("search"));

    const auto found = tracker.findByType("search");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].id, first);
    EXPECT_EQ(found[1].id, second);
}
