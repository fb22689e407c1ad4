#pragma once

#include "fence/engine.h"
#include "fence/internal/engine_state.h"

namespace fence {

class FenceEngineTestAccessor {
public:
    static const SegmentStore& segmentStore(const FenceEngine& engine) {
        return engine.state().segmentStore_;
    }

    static const PickSystem& pickSystem(const FenceEngine& engine) {
        return engine.state().pickSystem_;
    }

    static const HistoryManager& historyManager(const FenceEngine& engine) {
        return engine.state().historyManager_;
    }

    static const CalculationPipeline& calculation(const FenceEngine& engine) {
        return engine.state().calculation_;
    }

    static const InteractionSession& session(const FenceEngine& engine) {
        return engine.state().interactionSession_;
    }

    static FenceError lastError(const FenceEngine& engine) {
        return engine.state().lastError;
    }

    static std::uint32_t generation(const FenceEngine& engine) {
        return engine.state().generation;
    }

    static std::size_t queuedEvents(const FenceEngine& engine) {
        return engine.state().eventCount_;
    }
};

} // namespace fence
