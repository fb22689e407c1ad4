#pragma once

#include "fence/calc/calculation_pipeline.h"
#include "fence/config/engine_config.h"
#include "fence/history/history_manager.h"
#include "fence/interaction/interaction_session.h"
#include "fence/interaction/pick_system.h"
#include "fence/protocol/protocol_types.h"
#include "fence/scene/segment_store.h"
#include "fence/scene/selection_manager.h"
#include "fence/view/viewport.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace fence {

class FenceEngine;

struct EngineState {
    EngineState(FenceEngine& engine, const EngineConfig& cfg);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    EngineConfig config;

    SegmentStore segmentStore_;
    PickSystem pickSystem_;
    SelectionManager selectionManager_;
    HistoryManager historyManager_;
    Viewport viewport_;
    CalculationPipeline calculation_;
    InteractionSession interactionSession_;

    std::function<double()> clock_;

    protocol::Tool tool_{protocol::Tool::Fence};
    protocol::Tool toolBeforePan_{protocol::Tool::Fence};
    std::string activeStyleId_;
    std::string activeColorId_;
    std::vector<Segment> clipboard_{};

    std::uint32_t generation{0};

    static constexpr std::size_t kMaxEvents = 2048;
    std::vector<protocol::EngineEvent> eventQueue_{};
    std::size_t eventHead_{0};
    std::size_t eventTail_{0};
    std::size_t eventCount_{0};
    bool eventOverflowed_{false};
    std::uint32_t eventOverflowGeneration_{0};

    std::vector<SegmentId> pendingCreates_{};
    std::unordered_set<SegmentId> pendingDeletes_{};
    std::vector<SegmentId> pendingChanges_{};
    bool pendingSceneReplaced_{false};
    bool pendingSelectionChanged_{false};
    bool pendingHistoryChanged_{false};
    bool pendingViewportChanged_{false};
    bool pendingDraftChanged_{false};
    bool pendingCalculationUpdated_{false};

    mutable FenceError lastError{FenceError::Ok};
};

} // namespace fence
