// FenceEngine event stream. Changes are coalesced in pending sets and turned
// into EngineEvents when the host polls.

#include "fence/engine.h"
#include "fence/internal/engine_state.h"

#include <algorithm>

namespace fence {

namespace {
void eraseId(std::vector<SegmentId>& ids, SegmentId id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}
} // namespace

void FenceEngine::clearEventState() {
    EngineState& s = state();
    s.eventHead_ = 0;
    s.eventTail_ = 0;
    s.eventCount_ = 0;
    s.eventOverflowed_ = false;
    s.eventOverflowGeneration_ = 0;
    s.pendingCreates_.clear();
    s.pendingDeletes_.clear();
    s.pendingChanges_.clear();
    s.pendingSceneReplaced_ = false;
    s.pendingSelectionChanged_ = false;
    s.pendingHistoryChanged_ = false;
    s.pendingViewportChanged_ = false;
    s.pendingDraftChanged_ = false;
    s.pendingCalculationUpdated_ = false;
}

void FenceEngine::recordSegmentCreated(SegmentId id) {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    s.pendingDeletes_.erase(id);
    eraseId(s.pendingChanges_, id);
    s.pendingCreates_.push_back(id);
}

void FenceEngine::recordSegmentDeleted(SegmentId id) {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    eraseId(s.pendingChanges_, id);
    eraseId(s.pendingCreates_, id);
    s.pendingDeletes_.insert(id);
}

void FenceEngine::recordSegmentChanged(SegmentId id) {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    if (s.pendingDeletes_.find(id) != s.pendingDeletes_.end()) return;
    if (std::find(s.pendingCreates_.begin(), s.pendingCreates_.end(), id) != s.pendingCreates_.end()) return;
    if (std::find(s.pendingChanges_.begin(), s.pendingChanges_.end(), id) != s.pendingChanges_.end()) return;
    s.pendingChanges_.push_back(id);
}

void FenceEngine::recordSceneReplaced() {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    // A wholesale replacement supersedes per-segment notifications.
    s.pendingCreates_.clear();
    s.pendingDeletes_.clear();
    s.pendingChanges_.clear();
    s.pendingSceneReplaced_ = true;
}

void FenceEngine::recordSelectionChanged() {
    if (state().eventOverflowed_) return;
    state().pendingSelectionChanged_ = true;
}

void FenceEngine::recordHistoryChanged() {
    if (state().eventOverflowed_) return;
    state().pendingHistoryChanged_ = true;
}

void FenceEngine::recordViewportChanged() {
    if (state().eventOverflowed_) return;
    state().pendingViewportChanged_ = true;
}

void FenceEngine::recordDraftChanged() {
    if (state().eventOverflowed_) return;
    state().pendingDraftChanged_ = true;
}

void FenceEngine::recordCalculationUpdated() {
    if (state().eventOverflowed_) return;
    state().pendingCalculationUpdated_ = true;
}

bool FenceEngine::pushEvent(const EngineEvent& ev) {
    EngineState& s = state();
    if (s.eventOverflowed_) return false;
    if (s.eventCount_ >= EngineState::kMaxEvents) {
        s.eventOverflowed_ = true;
        s.eventOverflowGeneration_ = s.generation;
        s.eventHead_ = 0;
        s.eventTail_ = 0;
        s.eventCount_ = 0;
        return false;
    }
    s.eventQueue_[s.eventTail_] = ev;
    s.eventTail_ = (s.eventTail_ + 1) % EngineState::kMaxEvents;
    s.eventCount_++;
    return true;
}

void FenceEngine::flushPendingEvents() {
    EngineState& s = state();
    auto clearPending = [&]() {
        s.pendingCreates_.clear();
        s.pendingDeletes_.clear();
        s.pendingChanges_.clear();
        s.pendingSceneReplaced_ = false;
        s.pendingSelectionChanged_ = false;
        s.pendingHistoryChanged_ = false;
        s.pendingViewportChanged_ = false;
        s.pendingDraftChanged_ = false;
        s.pendingCalculationUpdated_ = false;
    };

    if (s.eventOverflowed_) {
        clearPending();
        return;
    }

    auto push = [&](EventType type, std::uint32_t a, std::uint32_t b) -> bool {
        if (!pushEvent(EngineEvent{static_cast<std::uint16_t>(type), 0, a, b, 0})) {
            clearPending();
            return false;
        }
        return true;
    };

    if (s.pendingSceneReplaced_) {
        if (!push(EventType::SceneReplaced, s.generation, static_cast<std::uint32_t>(s.segmentStore_.size()))) return;
    }

    for (const SegmentId id : s.pendingCreates_) {
        if (!push(EventType::SegmentCreated, id, 0)) return;
    }

    for (const SegmentId id : s.pendingChanges_) {
        if (!push(EventType::SegmentChanged, id, 0)) return;
    }

    if (!s.pendingDeletes_.empty()) {
        std::vector<SegmentId> ids(s.pendingDeletes_.begin(), s.pendingDeletes_.end());
        std::sort(ids.begin(), ids.end());
        for (const SegmentId id : ids) {
            if (!push(EventType::SegmentDeleted, id, 0)) return;
        }
    }

    if (s.pendingSelectionChanged_) {
        if (!push(EventType::SelectionChanged, s.selectionManager_.getGeneration(),
                static_cast<std::uint32_t>(s.selectionManager_.size()))) {
            return;
        }
    }

    if (s.pendingHistoryChanged_) {
        if (!push(EventType::HistoryChanged, s.generation, static_cast<std::uint32_t>(s.historyManager_.getCursor()))) return;
    }

    if (s.pendingViewportChanged_) {
        if (!push(EventType::ViewportChanged, s.generation, 0)) return;
    }

    if (s.pendingDraftChanged_) {
        if (!push(EventType::DraftChanged, s.interactionSession_.isDraftActive() ? 1u : 0u, 0)) return;
    }

    if (s.pendingCalculationUpdated_) {
        const CalculationResult& r = s.calculation_.result();
        if (!push(EventType::CalculationUpdated, static_cast<std::uint32_t>(r.requestToken),
                static_cast<std::uint32_t>(r.source))) {
            return;
        }
    }

    clearPending();
}

std::vector<FenceEngine::EngineEvent> FenceEngine::pollEvents(std::uint32_t maxEvents) {
    flushPendingEvents();

    EngineState& s = state();
    std::vector<EngineEvent> out;
    if (s.eventOverflowed_) {
        out.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::Overflow),
            0,
            s.eventOverflowGeneration_,
            0,
            0,
        });
        return out;
    }

    if (s.eventCount_ == 0 || maxEvents == 0) return out;

    const std::size_t count = std::min<std::size_t>(maxEvents, s.eventCount_);
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(s.eventQueue_[s.eventHead_]);
        s.eventHead_ = (s.eventHead_ + 1) % EngineState::kMaxEvents;
        s.eventCount_--;
    }
    return out;
}

void FenceEngine::ackResync(std::uint32_t resyncGeneration) {
    EngineState& s = state();
    if (!s.eventOverflowed_) return;
    if (resyncGeneration < s.eventOverflowGeneration_) return;
    clearEventState();
}

} // namespace fence
