#include "tests/engine_test_common.h"

using namespace fence;
using namespace engine_test;
using protocol::EventType;

namespace {
std::uint16_t typeOf(EventType t) {
    return static_cast<std::uint16_t>(t);
}
} // namespace

TEST_F(FenceEngineTest, DrawEmitsCreateAndHistory) {
    drainEvents(engine);
    const SegmentId id = drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});

    const auto events = drainEvents(engine);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events[0].type, typeOf(EventType::SegmentCreated));
    EXPECT_EQ(events[0].a, id);
    EXPECT_EQ(countEvents(events, EventType::HistoryChanged), 1u);
    EXPECT_EQ(countEvents(events, EventType::DraftChanged), 1u);

    EXPECT_TRUE(drainEvents(engine).empty());
}

TEST_F(FenceEngineTest, CreateThenDeleteInOneBatchReportsDeleteOnly) {
    drainEvents(engine);
    const SegmentId id = drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    engine.selectAll();
    engine.deleteSelected();

    const auto events = drainEvents(engine);
    EXPECT_EQ(countEvents(events, EventType::SegmentCreated), 0u);
    ASSERT_EQ(countEvents(events, EventType::SegmentDeleted), 1u);
    for (const auto& ev : events) {
        if (ev.type == typeOf(EventType::SegmentDeleted)) EXPECT_EQ(ev.a, id);
    }
}

TEST_F(FenceEngineTest, RestyleEmitsSegmentChanged) {
    const SegmentId id = drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    engine.selectAll();
    drainEvents(engine);

    engine.setActiveColor("brown");
    EXPECT_EQ(engine.getSegment(id)->colorId, "brown");
    const auto events = drainEvents(engine);
    ASSERT_EQ(countEvents(events, EventType::SegmentChanged), 1u);
    EXPECT_EQ(events[0].type, typeOf(EventType::SegmentChanged));
    EXPECT_EQ(events[0].a, id);
    EXPECT_EQ(countEvents(events, EventType::HistoryChanged), 1u);
}

TEST_F(FenceEngineTest, UndoReportsSceneReplaced) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    drainEvents(engine);

    ASSERT_TRUE(engine.undo());
    const auto events = drainEvents(engine);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events[0].type, typeOf(EventType::SceneReplaced));
    EXPECT_EQ(events[0].b, 0u);
    EXPECT_EQ(countEvents(events, EventType::SegmentDeleted), 0u);
    EXPECT_EQ(countEvents(events, EventType::HistoryChanged), 1u);
}

TEST_F(FenceEngineTest, CalculationPublishesEvent) {
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});
    drainEvents(engine);
    engine.calculateNow();
    const auto events = drainEvents(engine);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, typeOf(EventType::CalculationUpdated));
    EXPECT_EQ(events[0].a, static_cast<std::uint32_t>(engine.getCalculation().requestToken));
    EXPECT_EQ(events[0].b, static_cast<std::uint32_t>(CalculationSource::Fallback));
}

TEST_F(FenceEngineTest, PollRespectsMaxEvents) {
    drainEvents(engine);
    drawSegment(engine, {Point2{0.0f, 0.0f}, Point2{100.0f, 0.0f}});

    const auto first = engine.pollEvents(1);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].type, typeOf(EventType::SegmentCreated));

    const auto rest = engine.pollEvents(64);
    EXPECT_GE(rest.size(), 1u);
    EXPECT_EQ(countEvents(rest, EventType::SegmentCreated), 0u);
}

TEST_F(FenceEngineTest, ViewportChangesAreCoalesced) {
    drainEvents(engine);
    engine.zoomIn();
    engine.panBy(10.0f, 0.0f);
    engine.zoomOut();
    const auto events = drainEvents(engine);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, typeOf(EventType::ViewportChanged));
}

TEST_F(FenceEngineTest, OverflowTriggersResyncAck) {
    for (int i = 0; i < 40; ++i) {
        const float y = static_cast<float>(i) * 100.0f;
        drawSegment(engine, {Point2{0.0f, y}, Point2{100.0f, y}});
    }
    engine.selectAll();
    ASSERT_EQ(engine.copySelected(), 40u);
    for (int i = 0; i < 55; ++i) {
        ASSERT_EQ(engine.paste().size(), 40u);
    }

    const auto events = engine.pollEvents(1024);
    ASSERT_EQ(events.size(), 1u);
    ASSERT_EQ(events[0].type, typeOf(EventType::Overflow));

    // Still overflowed until the host acknowledges.
    drawSegment(engine, {Point2{0.0f, 9000.0f}, Point2{100.0f, 9000.0f}});
    const auto again = engine.pollEvents(16);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].type, typeOf(EventType::Overflow));

    engine.ackResync(events[0].a);
    EXPECT_TRUE(engine.pollEvents(16).empty());

    engine.zoomIn();
    const auto after = engine.pollEvents(16);
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].type, typeOf(EventType::ViewportChanged));
}
