#include "tests/engine_test_common.h"

using namespace fence;
using namespace engine_test;

TEST(RenderFormatTest, FeetUseOneDecimal) {
    EXPECT_EQ(formatFeet(5.0), "5.0 ft");
    EXPECT_EQ(formatFeet(12.34), "12.3 ft");
}

TEST_F(FenceEngineTest, FenceVisualHasPostsAndLabel) {
    const SegmentId id = drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    const RenderScene scene = engine.buildRenderScene();
    ASSERT_EQ(scene.segments.size(), 1u);

    const SegmentVisual& v = scene.segments[0];
    EXPECT_EQ(v.id, id);
    EXPECT_EQ(v.stroke, "#ffffff");
    EXPECT_FLOAT_EQ(v.strokeWidth, kFenceStrokeWidth);
    EXPECT_TRUE(v.dash.empty());
    EXPECT_FALSE(v.selected);
    ASSERT_EQ(v.posts.size(), 2u);
    EXPECT_EQ(v.posts[0].kind, PostKind::End);
    EXPECT_EQ(v.posts[1].kind, PostKind::End);
    EXPECT_EQ(v.lengthLabel.text, "5.0 ft");
    EXPECT_FLOAT_EQ(v.lengthLabel.at.x, 50.0f);
    EXPECT_TRUE(scene.dimensions.empty());
}

TEST_F(FenceEngineTest, GatesAreDashedAndThicker) {
    engine.setTool(FenceEngine::Tool::Gate);
    engine.setActiveColor("black");
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{80.0f, 0.0f}});
    const RenderScene scene = engine.buildRenderScene();
    ASSERT_EQ(scene.segments.size(), 1u);
    const SegmentVisual& v = scene.segments[0];
    EXPECT_TRUE(v.isGate);
    EXPECT_EQ(v.stroke, "#000000");
    EXPECT_FLOAT_EQ(v.strokeWidth, kGateStrokeWidth);
    EXPECT_EQ(v.dash, (std::vector<float>{10.0f, 5.0f}));
}

TEST_F(FenceEngineTest, SharpTurnsGetCornerPosts) {
    drawSegment(engine, {
        Point2{0.0f, 0.0f},
        Point2{200.0f, 0.0f},    // 90 degree turn
        Point2{200.0f, 200.0f},
        Point2{220.0f, 400.0f},  // shallow turn, no post
        Point2{240.0f, 600.0f},
    });
    const RenderScene scene = engine.buildRenderScene();
    ASSERT_EQ(scene.segments.size(), 1u);
    const auto& posts = scene.segments[0].posts;
    std::size_t corners = 0;
    for (const PostMarker& p : posts) {
        if (p.kind == PostKind::Corner) corners++;
    }
    EXPECT_EQ(corners, 1u);
    EXPECT_EQ(posts.size(), 3u);
}

TEST_F(FenceEngineTest, SelectionIsHighlighted) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    drawSegment(engine, {Point2{0.0f, 100.0f}, Point2{100.0f, 100.0f}});
    engine.cycleSelection();
    const RenderScene scene = engine.buildRenderScene();
    ASSERT_EQ(scene.segments.size(), 2u);
    EXPECT_TRUE(scene.segments[0].selected);
    EXPECT_FALSE(scene.segments[1].selected);
}

TEST_F(FenceEngineTest, DimensionsFollowToggle) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}, Point2{100.0f, 60.0f}});
    engine.setShowDimensions(true);
    const RenderScene scene = engine.buildRenderScene();
    ASSERT_EQ(scene.dimensions.size(), 2u);
    EXPECT_EQ(scene.dimensions[0].label.text, "5.0 ft");
    EXPECT_EQ(scene.dimensions[1].label.text, "3.0 ft");
    EXPECT_FLOAT_EQ(scene.dimensions[0].from.y, -kDimensionOffset);
}

TEST_F(FenceEngineTest, DraftPreviewIsRendered) {
    engine.beginDraw(0.0f, 0.0f);
    engine.continueDraw(60.0f, 0.0f);
    const RenderScene scene = engine.buildRenderScene();
    ASSERT_TRUE(scene.draft.active);
    ASSERT_EQ(scene.draft.path.size(), 2u);
    EXPECT_EQ(scene.draft.path[1], (Point2{60.0f, 0.0f}));
    EXPECT_EQ(scene.draft.lengthLabel.text, "3.0 ft");
}

TEST_F(FenceEngineTest, HoverShowsSnapIndicator) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    engine.handleInput(protocol::pointerEvent(protocol::InputKind::PointerMove, 104.0f, 3.0f));
    const RenderScene scene = engine.buildRenderScene();
    EXPECT_TRUE(scene.snap.visible);
    EXPECT_EQ(scene.snap.kind, SnapKind::Vertex);
    EXPECT_EQ(scene.snap.at, (Point2{100.0f, 0.0f}));
    EXPECT_FLOAT_EQ(scene.view.zoom, 1.0f);
}
