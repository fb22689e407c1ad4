#include "tests/engine_test_common.h"

using namespace fence;
using namespace engine_test;
using protocol::InputKind;
using protocol::Key;

namespace {

constexpr std::uint32_t kShift = static_cast<std::uint32_t>(protocol::InputModifier::Shift);
constexpr std::uint32_t kCtrl = static_cast<std::uint32_t>(protocol::InputModifier::Ctrl);
constexpr std::uint32_t kMeta = static_cast<std::uint32_t>(protocol::InputModifier::Meta);

void drag(FenceEngine& engine, float x0, float y0, float x1, float y1) {
    engine.handleInput(protocol::pointerEvent(InputKind::PointerDown, x0, y0));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerMove, x1, y1));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerUp, x1, y1));
}

void press(FenceEngine& engine, Key key, std::uint32_t modifiers = 0) {
    engine.handleInput(protocol::keyEvent(InputKind::KeyDown, key, modifiers));
    engine.handleInput(protocol::keyEvent(InputKind::KeyUp, key, modifiers));
}

} // namespace

TEST_F(FenceEngineTest, PointerDragDrawsFence) {
    drag(engine, 0.0f, 0.0f, 200.0f, 0.0f);
    ASSERT_EQ(engine.getSegmentCount(), 1u);
    EXPECT_FALSE(engine.isDrawing());
}

TEST_F(FenceEngineTest, AppendVertexInputAddsCorner) {
    engine.handleInput(protocol::pointerEvent(InputKind::PointerDown, 0.0f, 0.0f));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerMove, 100.0f, 0.0f));
    EXPECT_TRUE(engine.handleInput(protocol::pointerEvent(InputKind::AppendVertex, 100.0f, 0.0f)));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerMove, 100.0f, 100.0f));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerUp, 100.0f, 100.0f));
    ASSERT_EQ(engine.getSegmentCount(), 1u);
    EXPECT_EQ(engine.getSegments()[0].path.size(), 3u);
}

TEST_F(FenceEngineTest, PointerLeaveCancelsDraft) {
    engine.handleInput(protocol::pointerEvent(InputKind::PointerDown, 0.0f, 0.0f));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerMove, 100.0f, 0.0f));
    EXPECT_TRUE(engine.handleInput(protocol::pointerEvent(InputKind::PointerLeave, 100.0f, 0.0f)));
    EXPECT_FALSE(engine.isDrawing());
    EXPECT_EQ(engine.getSegmentCount(), 0u);
}

TEST_F(FenceEngineTest, EscapeCancelsDraftAndSelection) {
    drag(engine, 0.0f, 0.0f, 200.0f, 0.0f);
    engine.selectAll();
    engine.handleInput(protocol::pointerEvent(InputKind::PointerDown, 0.0f, 100.0f));
    press(engine, Key::Escape);
    EXPECT_FALSE(engine.isDrawing());
    EXPECT_TRUE(engine.getSelection().empty());
}

TEST_F(FenceEngineTest, EnterConfirmsDraft) {
    engine.handleInput(protocol::pointerEvent(InputKind::PointerDown, 0.0f, 0.0f));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerMove, 100.0f, 0.0f));
    EXPECT_TRUE(engine.handleInput(protocol::keyEvent(InputKind::KeyDown, Key::Enter)));
    EXPECT_EQ(engine.getSegmentCount(), 1u);
    EXPECT_FALSE(engine.handleInput(protocol::keyEvent(InputKind::KeyDown, Key::Enter)));
}

TEST_F(FenceEngineTest, SelectToolClickAndDelete) {
    drag(engine, 0.0f, 0.0f, 200.0f, 0.0f);
    drag(engine, 0.0f, 100.0f, 200.0f, 100.0f);
    engine.setTool(FenceEngine::Tool::Select);

    engine.handleInput(protocol::pointerEvent(InputKind::PointerDown, 100.0f, 2.0f));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerUp, 100.0f, 2.0f));
    ASSERT_EQ(engine.getSelection().size(), 1u);

    press(engine, Key::Backspace);
    EXPECT_EQ(engine.getSegmentCount(), 1u);
    EXPECT_EQ(engine.getSegments()[0].path[0].y, 100.0f);
}

TEST_F(FenceEngineTest, KeyboardShortcutsDriveHistoryAndClipboard) {
    drag(engine, 0.0f, 0.0f, 200.0f, 0.0f);

    press(engine, Key::KeyZ, kCtrl);
    EXPECT_EQ(engine.getSegmentCount(), 0u);
    press(engine, Key::KeyZ, kCtrl | kShift);
    EXPECT_EQ(engine.getSegmentCount(), 1u);
    press(engine, Key::KeyZ, kMeta);
    press(engine, Key::KeyY, kCtrl);
    EXPECT_EQ(engine.getSegmentCount(), 1u);

    press(engine, Key::KeyA, kCtrl);
    EXPECT_EQ(engine.getSelection().size(), 1u);
    press(engine, Key::KeyC, kCtrl);
    press(engine, Key::KeyV, kCtrl);
    EXPECT_EQ(engine.getSegmentCount(), 2u);
    press(engine, Key::KeyD, kCtrl);
    EXPECT_EQ(engine.getSegmentCount(), 3u);
}

TEST_F(FenceEngineTest, TabCyclesSelection) {
    drag(engine, 0.0f, 0.0f, 200.0f, 0.0f);
    drag(engine, 0.0f, 100.0f, 200.0f, 100.0f);
    const auto& segments = engine.getSegments();
    press(engine, Key::Tab);
    EXPECT_EQ(engine.getSelection(), (std::vector<SegmentId>{segments[0].id}));
    press(engine, Key::Tab);
    EXPECT_EQ(engine.getSelection(), (std::vector<SegmentId>{segments[1].id}));
}

TEST_F(FenceEngineTest, ShiftHoldsPrecisionMode) {
    engine.handleInput(protocol::keyEvent(InputKind::KeyDown, Key::Shift));
    EXPECT_TRUE(engine.isPrecisionMode());
    engine.handleInput(protocol::keyEvent(InputKind::KeyUp, Key::Shift));
    EXPECT_FALSE(engine.isPrecisionMode());
}

TEST_F(FenceEngineTest, SpaceTogglesPanTool) {
    engine.setTool(FenceEngine::Tool::Gate);
    press(engine, Key::Space);
    EXPECT_EQ(engine.getTool(), FenceEngine::Tool::Pan);

    engine.handleInput(protocol::pointerEvent(InputKind::PointerDown, 100.0f, 100.0f));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerMove, 130.0f, 80.0f));
    engine.handleInput(protocol::pointerEvent(InputKind::PointerUp, 130.0f, 80.0f));
    EXPECT_FLOAT_EQ(engine.getPanX(), 30.0f);
    EXPECT_FLOAT_EQ(engine.getPanY(), -20.0f);
    EXPECT_EQ(engine.getSegmentCount(), 0u);

    press(engine, Key::Space);
    EXPECT_EQ(engine.getTool(), FenceEngine::Tool::Gate);
}

TEST_F(FenceEngineTest, CtrlGTogglesGridSnap) {
    ASSERT_TRUE(engine.config().snap.gridEnabled);
    press(engine, Key::KeyG, kCtrl);
    EXPECT_FALSE(engine.config().snap.gridEnabled);
    press(engine, Key::KeyG, kCtrl);
    EXPECT_TRUE(engine.config().snap.gridEnabled);
}
