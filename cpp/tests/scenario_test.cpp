#include "tests/engine_test_common.h"

using namespace fence;
using namespace engine_test;

TEST_F(FenceEngineTest, StraightRunMeasuresFiveFeet) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    engine.calculateNow();
    const CalculationResult& r = engine.getCalculation();
    EXPECT_DOUBLE_EQ(r.measurements.totalLengthFt, 5.0);
    EXPECT_EQ(r.measurements.cornerCount, 0u);
    EXPECT_EQ(r.measurements.segmentCount, 1u);
}

TEST_F(FenceEngineTest, ThreePointRunHasOneCorner) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}, Point2{100.0f, 100.0f}});
    engine.calculateNow();
    EXPECT_EQ(engine.getCalculation().measurements.cornerCount, 1u);
}

TEST_F(FenceEngineTest, UnreachableServiceGivesFallbackQuote) {
    auto client = std::make_shared<FakeEstimatorClient>(FakeEstimatorClient::Mode::Fail);
    engine.setEstimatorClient(client);
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}});
    clock.nowMs += 500.0;
    engine.tick();

    ASSERT_EQ(client->requests.size(), 1u);
    const CalculationResult& r = engine.getCalculation();
    EXPECT_EQ(r.source, CalculationSource::Fallback);
    EXPECT_EQ(r.materials.panels, 2u);
    EXPECT_EQ(r.materials.posts, 3u);
    EXPECT_EQ(r.materials.hardware, 8u);
    EXPECT_DOUBLE_EQ(r.cost.materialCost, 150.0);
    EXPECT_DOUBLE_EQ(r.cost.laborCost, 80.0);
    EXPECT_DOUBLE_EQ(r.cost.gateCost, 0.0);
    EXPECT_DOUBLE_EQ(r.cost.totalCost, 230.0);
    EXPECT_DOUBLE_EQ(r.cost.costPerFoot, 23.0);
}

TEST_F(FenceEngineTest, DeleteTwoOfFiveThenUndo) {
    std::vector<SegmentId> ids;
    for (int i = 0; i < 5; ++i) {
        const float y = static_cast<float>(i) * 100.0f;
        ids.push_back(drawSegment(engine, {Point2{0.0f, y}, Point2{200.0f, y}}));
    }
    ASSERT_EQ(engine.getSegmentCount(), 5u);

    const SegmentId doomed[] = {ids[1], ids[3]};
    engine.setSelection(doomed, 2, FenceEngine::SelectionMode::Replace);
    EXPECT_EQ(engine.deleteSelected(), 2u);
    EXPECT_EQ(engine.getSegmentCount(), 3u);
    EXPECT_EQ(engine.getSegment(ids[1]), nullptr);

    ASSERT_TRUE(engine.undo());
    ASSERT_EQ(engine.getSegmentCount(), 5u);
    for (std::size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(engine.getSegments()[i].id, ids[i]);
    }
}

TEST_F(FenceEngineTest, PasteOffsetsCopiesWithFreshIds) {
    const SegmentId original = drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}});
    engine.selectAll();
    ASSERT_EQ(engine.copySelected(), 1u);

    const std::vector<SegmentId> first = engine.paste();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_NE(first[0], original);
    const Segment* copy = engine.getSegment(first[0]);
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->path[0], (Point2{40.0f, 40.0f}));
    EXPECT_EQ(copy->path[1], (Point2{240.0f, 40.0f}));
    EXPECT_EQ(copy->styleId, engine.getSegment(original)->styleId);

    const std::vector<SegmentId> second = engine.paste();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(engine.getSegment(second[0])->path[0], (Point2{80.0f, 80.0f}));
    EXPECT_EQ(engine.getSelection(), (std::vector<SegmentId>{original}));

    // Each paste is its own undo step.
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getSegmentCount(), 2u);
}

TEST_F(FenceEngineTest, RestyleSelectionIsOneUndoStep) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}});
    drawSegment(engine, {Point2{0.0f, 100.0f}, Point2{200.0f, 100.0f}});
    engine.selectAll();
    const std::size_t historyBefore = engine.getHistorySize();

    EXPECT_EQ(engine.restyleSelected("wood-picket", "cedar"), 2u);
    EXPECT_EQ(engine.getHistorySize(), historyBefore + 1);
    for (const Segment& s : engine.getSegments()) {
        EXPECT_EQ(s.styleId, "wood-picket");
        EXPECT_EQ(s.colorId, "cedar");
    }
    EXPECT_EQ(engine.restyleSelected("wood-picket", "cedar"), 0u);
    EXPECT_EQ(engine.getHistorySize(), historyBefore + 1);

    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getSegments()[0].colorId, "white");
}

TEST_F(FenceEngineTest, ClearSceneIsUndoable) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{200.0f, 0.0f}});
    drawSegment(engine, {Point2{0.0f, 100.0f}, Point2{200.0f, 100.0f}});
    engine.clearScene();
    EXPECT_EQ(engine.getSegmentCount(), 0u);
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getSegmentCount(), 2u);
}
