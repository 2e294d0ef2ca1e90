#include <gtest/gtest.h>
#include "reflow/epoch/epoch_position_mapper.h"
#include "tests/reflow_test_common.h"
#include <string>

using namespace reflow::epoch;
using reflow_test::editOf;
using reflow_test::editOfRanges;
using reflow_test::noopEdit;

namespace {

EpochPositionMapper::Options keep(std::int64_t maxEpochs) {
    EpochPositionMapper::Options options;
    options.maxEpochsToKeep = maxEpochs;
    return options;
}

} // namespace

TEST(EpochPositionMapperTest, StartsAtEpochZero) {
    EpochPositionMapper mapper;
    EXPECT_EQ(mapper.getCurrentEpoch(), 0);
    EXPECT_EQ(mapper.maxEpochsToKeep(), 100);
    EXPECT_EQ(mapper.retainedEpochCount(), 0u);
}

TEST(EpochPositionMapperTest, IgnoresEditsWithoutDocumentChange) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(noopEdit());
    EXPECT_EQ(mapper.getCurrentEpoch(), 0);
    EXPECT_EQ(mapper.retainedEpochCount(), 0u);
}

TEST(EpochPositionMapperTest, MapsAcrossEpochs) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOfRanges({1, 0, 2}));
    mapper.recordTransaction(editOfRanges({3, 1, 0}));
    ASSERT_EQ(mapper.getCurrentEpoch(), 2);

    // 5 -> 7 (insert at 1) -> 6 (delete at 3)
    const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(5, 0, 1);
    ASSERT_TRUE(mapped.ok);
    EXPECT_EQ(mapped.pos, 6);
    EXPECT_EQ(mapped.fromEpoch, 0);
    EXPECT_EQ(mapped.toEpoch, 2);
}

TEST(EpochPositionMapperTest, ReportsDeletedPositions) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOfRanges({3, 2, 0}));

    const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(4, 0, 1);
    EXPECT_FALSE(mapped.ok);
    EXPECT_EQ(mapped.reason, MapPosFailureReason::Deleted);
    EXPECT_FALSE(mapper.mapPosFromLayoutToCurrent(4, 0, 1).has_value());
}

TEST(EpochPositionMapperTest, MissingTransformIsReportedAndCounted) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOfRanges({1, 0, 1}));
    mapper.recordTransaction(editOfRanges({2, 0, 1}));

    mapper.onLayoutComplete(1);

    const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(1, 0, 1);
    EXPECT_FALSE(mapped.ok);
    EXPECT_EQ(mapped.reason, MapPosFailureReason::MissingStepMap);
    EXPECT_EQ(mapper.missingStepMapCount(), 1u);

    const MapPosResult fromPainted = mapper.mapPosFromLayoutToCurrentDetailed(1, 1, 1);
    EXPECT_TRUE(fromPainted.ok);
}

TEST(EpochPositionMapperTest, EpochTooOldAfterWindowPrune) {
    EpochPositionMapper mapper(keep(2));
    for (int i = 0; i < 5; ++i) {
        mapper.recordTransaction(editOfRanges({1, 0, 1}));
    }

    const MapPosResult old = mapper.mapPosFromLayoutToCurrentDetailed(1, 0, 1);
    EXPECT_FALSE(old.ok);
    EXPECT_EQ(old.reason, MapPosFailureReason::EpochTooOld);

    const MapPosResult recent = mapper.mapPosFromLayoutToCurrentDetailed(1, mapper.getCurrentEpoch() - 1, 1);
    ASSERT_TRUE(recent.ok);
    EXPECT_EQ(recent.pos, 2);

    EXPECT_EQ(mapper.retainedEpochCount(), 2u);
    EXPECT_EQ(mapper.oldestRetainedEpoch(), 3);
}

TEST(EpochPositionMapperTest, RejectsNegativePosition) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOfRanges({1, 0, 1}));

    const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(-1, 0, 1);
    EXPECT_FALSE(mapped.ok);
    EXPECT_EQ(mapped.reason, MapPosFailureReason::InvalidPos);
}

TEST(EpochPositionMapperTest, RejectsNegativeEpoch) {
    EpochPositionMapper mapper;
    const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(5, -1, 1);
    EXPECT_FALSE(mapped.ok);
    EXPECT_EQ(mapped.reason, MapPosFailureReason::InvalidEpoch);
}

TEST(EpochPositionMapperTest, RejectsEpochFromTheFuture) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOfRanges({1, 0, 1}));

    const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(5, 5, 1);
    EXPECT_FALSE(mapped.ok);
    EXPECT_EQ(mapped.reason, MapPosFailureReason::InvalidEpoch);
}

TEST(EpochPositionMapperTest, LayoutPruneAndWindowPruneTogether) {
    EpochPositionMapper mapper(keep(3));
    for (int i = 0; i < 5; ++i) {
        mapper.recordTransaction(editOfRanges({1, 0, 1}));
    }

    mapper.onLayoutComplete(3);

    EXPECT_FALSE(mapper.mapPosFromLayoutToCurrentDetailed(5, 0, 1).ok);
    EXPECT_TRUE(mapper.mapPosFromLayoutToCurrentDetailed(5, 3, 1).ok);
    EXPECT_EQ(mapper.oldestRetainedEpoch(), 3);
}

TEST(EpochPositionMapperTest, LayoutCompleteIsIdempotent) {
    EpochPositionMapper mapper;
    for (int i = 0; i < 4; ++i) {
        mapper.recordTransaction(editOfRanges({0, 0, 1}));
    }

    mapper.onLayoutComplete(2);
    const std::size_t retained = mapper.retainedEpochCount();
    mapper.onLayoutComplete(2);
    mapper.onLayoutComplete(1);
    EXPECT_EQ(mapper.retainedEpochCount(), retained);
    EXPECT_EQ(retained, 2u);
}

TEST(EpochPositionMapperTest, EmptyTransformKeepsPosition) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOf({}));

    const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(5, 0, 1);
    ASSERT_TRUE(mapped.ok);
    EXPECT_EQ(mapped.pos, 5);
}

TEST(EpochPositionMapperTest, CurrentEpochMapsToItself) {
    EpochPositionMapper mapper;
    const MapPosResult atStart = mapper.mapPosFromLayoutToCurrentDetailed(42, 0, 1);
    ASSERT_TRUE(atStart.ok);
    EXPECT_EQ(atStart.pos, 42);
    EXPECT_EQ(atStart.fromEpoch, 0);
    EXPECT_EQ(atStart.toEpoch, 0);

    for (int i = 0; i < 7; ++i) {
        mapper.recordTransaction(editOfRanges({0, 3, 0}));
        const MapPosResult mapped = mapper.mapPosFromLayoutToCurrentDetailed(42, mapper.getCurrentEpoch(), -1);
        ASSERT_TRUE(mapped.ok);
        EXPECT_EQ(mapped.pos, 42);
    }
}

TEST(EpochPositionMapperTest, EpochAdvancesOnlyOnDocumentChange) {
    EpochPositionMapper mapper;
    Epoch previous = mapper.getCurrentEpoch();
    for (int i = 0; i < 10; ++i) {
        const bool changes = i % 3 != 0;
        mapper.recordTransaction(changes ? editOfRanges({0, 0, 1}) : noopEdit());
        const Epoch current = mapper.getCurrentEpoch();
        EXPECT_EQ(current, changes ? previous + 1 : previous);
        previous = current;
    }
}

TEST(EpochPositionMapperTest, ComplexSequence) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOfRanges({0, 0, 10}));
    mapper.recordTransaction(editOfRanges({5, 5, 0}));
    mapper.recordTransaction(editOfRanges({2, 0, 3}));

    // 8 -> 18 -> 13 -> 16
    EXPECT_EQ(mapper.mapPosFromLayoutToCurrent(8, 0, 1), std::optional<std::int64_t>(16));
}

TEST(EpochPositionMapperTest, AssocIsThreadedThroughReplay) {
    EpochPositionMapper mapper;
    mapper.recordTransaction(editOfRanges({4, 0, 2}));
    mapper.recordTransaction(editOfRanges({0, 0, 1}));

    EXPECT_EQ(mapper.mapPosFromLayoutToCurrent(4, 0, 1), std::optional<std::int64_t>(7));
    EXPECT_EQ(mapper.mapPosFromLayoutToCurrent(4, 0, -1), std::optional<std::int64_t>(5));
}

TEST(EpochPositionMapperTest, WindowClampedToAtLeastOne) {
    EpochPositionMapper mapper(keep(0));
    EXPECT_EQ(mapper.maxEpochsToKeep(), 1);

    mapper.recordTransaction(editOfRanges({0, 0, 1}));
    mapper.recordTransaction(editOfRanges({0, 0, 1}));
    EXPECT_TRUE(mapper.mapPosFromLayoutToCurrentDetailed(0, 1, 1).ok);
    EXPECT_EQ(mapper.mapPosFromLayoutToCurrentDetailed(0, 0, 1).reason, MapPosFailureReason::EpochTooOld);
}

TEST(EpochPositionMapperTest, ReasonNamesAreStable) {
    EXPECT_EQ(std::string(toString(MapPosFailureReason::InvalidEpoch)), "invalid_epoch");
    EXPECT_EQ(std::string(toString(MapPosFailureReason::EpochTooOld)), "epoch_too_old");
    EXPECT_EQ(std::string(toString(MapPosFailureReason::MissingStepMap)), "missing_stepmap");
    EXPECT_EQ(std::string(toString(MapPosFailureReason::Deleted)), "deleted");
    EXPECT_EQ(std::string(toString(MapPosFailureReason::InvalidPos)), "invalid_pos");
}
