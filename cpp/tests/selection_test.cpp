#include "tests/engine_test_common.h"
#include "fence/scene/segment_store.h"
#include "fence/scene/selection_manager.h"

using namespace fence;
using namespace engine_test;

namespace {

void fillStore(SegmentStore& store, int count) {
    for (int i = 0; i < count; ++i) {
        SegmentId id = 0;
        const float y = static_cast<float>(i) * 100.0f;
        ASSERT_EQ(store.create({Point2{0.0f, y}, Point2{100.0f, y}}, "vinyl-privacy", "white", false, id), FenceError::Ok);
    }
}

constexpr std::uint32_t kShift = static_cast<std::uint32_t>(protocol::InputModifier::Shift);
constexpr std::uint32_t kCtrl = static_cast<std::uint32_t>(protocol::InputModifier::Ctrl);

} // namespace

TEST(SelectionManagerTest, PickModifiersSelectAddAndToggle) {
    SegmentStore store;
    fillStore(store, 3);
    SelectionManager sel(store);

    EXPECT_TRUE(sel.selectByPick(2, 0));
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{2}));

    EXPECT_TRUE(sel.selectByPick(1, kShift));
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{1, 2}));

    EXPECT_TRUE(sel.selectByPick(2, kCtrl));
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{1}));

    // Shift on a miss keeps the selection; a plain miss clears it.
    EXPECT_FALSE(sel.selectByPick(kInvalidSegmentId, kShift));
    EXPECT_EQ(sel.size(), 1u);
    EXPECT_TRUE(sel.selectByPick(kInvalidSegmentId, 0));
    EXPECT_TRUE(sel.isEmpty());
}

TEST(SelectionManagerTest, ReplaceWithSameSetIsNotAChange) {
    SegmentStore store;
    fillStore(store, 2);
    SelectionManager sel(store);

    const SegmentId ids[] = {1, 2};
    EXPECT_TRUE(sel.setSelection(ids, 2, SelectionManager::Mode::Replace));
    const std::uint32_t gen = sel.getGeneration();
    const SegmentId reversed[] = {2, 1};
    EXPECT_FALSE(sel.setSelection(reversed, 2, SelectionManager::Mode::Replace));
    EXPECT_EQ(sel.getGeneration(), gen);
}

TEST(SelectionManagerTest, UnknownIdsAreIgnored) {
    SegmentStore store;
    fillStore(store, 1);
    SelectionManager sel(store);
    const SegmentId ids[] = {1, 42};
    EXPECT_TRUE(sel.setSelection(ids, 2, SelectionManager::Mode::Add));
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{1}));
}

TEST(SelectionManagerTest, CycleWalksStoreOrder) {
    SegmentStore store;
    fillStore(store, 3);
    SelectionManager sel(store);

    EXPECT_TRUE(sel.cycle());
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{1}));
    EXPECT_TRUE(sel.cycle());
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{2}));
    EXPECT_TRUE(sel.cycle());
    EXPECT_TRUE(sel.cycle());
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{1}));
}

TEST(SelectionManagerTest, PruneDropsRemovedSegments) {
    SegmentStore store;
    fillStore(store, 3);
    SelectionManager sel(store);
    EXPECT_TRUE(sel.selectAll());
    EXPECT_EQ(store.removeMany({2}), 1u);
    EXPECT_TRUE(sel.prune());
    EXPECT_EQ(sel.getOrdered(), (std::vector<SegmentId>{1, 3}));
    EXPECT_FALSE(sel.prune());
}

TEST_F(FenceEngineTest, ClickSelectsNearestSegmentWithinTolerance) {
    const SegmentId a = drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}});
    const SegmentId b = drawSegment(engine, {Point2{0.0f, 100.0f}, Point2{200.0f, 100.0f}});
    ASSERT_NE(a, kInvalidSegmentId);
    ASSERT_NE(b, kInvalidSegmentId);

    engine.setTool(FenceEngine::Tool::Select);
    engine.selectAt(100.0f, 6.0f, 0);
    EXPECT_EQ(engine.getSelection(), (std::vector<SegmentId>{a}));

    engine.selectAt(100.0f, 96.0f, kShift);
    EXPECT_EQ(engine.getSelection(), (std::vector<SegmentId>{a, b}));

    engine.selectAt(100.0f, 50.0f, 0);
    EXPECT_TRUE(engine.getSelection().empty());
}

TEST_F(FenceEngineTest, PickToleranceScalesWithZoom) {
    const SegmentId a = drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}});
    EXPECT_EQ(engine.pickAt(100.0f, 8.0f), a);

    // At 2x, 10 screen pixels are 5 world units.
    engine.zoomAt(0.0f, 0.0f, 1.0f);
    ASSERT_FLOAT_EQ(engine.getZoom(), 2.0f);
    EXPECT_EQ(engine.pickAt(100.0f, 8.0f), kInvalidSegmentId);
    EXPECT_EQ(engine.pickAt(100.0f, 4.0f), a);
}

TEST_F(FenceEngineTest, DeletingSelectionPrunesIt) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}});
    drawSegment(engine, {Point2{0.0f, 100.0f}, Point2{200.0f, 100.0f}});
    engine.selectAll();
    EXPECT_EQ(engine.deleteSelected(), 2u);
    EXPECT_TRUE(engine.getSelection().empty());
    EXPECT_EQ(engine.getSegmentCount(), 0u);
}

TEST(SegmentStoreTest, RejectsCoordinatesBeyondWorkingArea) {
    SegmentStore store;
    SegmentId id = kInvalidSegmentId;
    EXPECT_EQ(store.create({Point2{0.0f, 0.0f}, Point2{2.0e6f, 0.0f}}, "wood-privacy", "cedar", false, id),
              FenceError::InvalidGeometry);
    EXPECT_EQ(id, kInvalidSegmentId);
    EXPECT_TRUE(store.empty());
}

TEST(SegmentStoreTest, IdsNeverWrapAfterMaximalRestore) {
    SegmentStore store;
    Segment top{};
    top.id = kMaxSegmentId;
    top.path = {Point2{0.0f, 0.0f}, Point2{20.0f, 0.0f}};

    Segment tooHigh = top;
    tooHigh.id = 0xFFFFFFFFu;
    EXPECT_EQ(store.replaceAll({tooHigh}), FenceError::InvalidGeometry);

    ASSERT_EQ(store.replaceAll({top}), FenceError::Ok);
    SegmentId id = kInvalidSegmentId;
    EXPECT_EQ(store.create({Point2{0.0f, 40.0f}, Point2{20.0f, 40.0f}}, "wood-privacy", "cedar", false, id),
              FenceError::InvalidOperation);
    EXPECT_EQ(store.allocateId(), kInvalidSegmentId);
    EXPECT_EQ(store.size(), 1u);
}
