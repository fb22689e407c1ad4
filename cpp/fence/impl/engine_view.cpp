// FenceEngine viewport, calculation and share-token operations

#include "fence/engine.h"
#include "fence/core/logging.h"
#include "fence/geometry/geometry.h"
#include "fence/internal/engine_state.h"
#include "fence/persistence/share_codec.h"

namespace fence {

namespace {
Bounds2 sceneBounds(const SegmentStore& store) {
    Bounds2 bounds{0.0f, 0.0f, 0.0f, 0.0f, false};
    for (const Segment& seg : store.segments()) {
        for (const Point2& p : seg.path) geometry::expandBounds(bounds, p);
    }
    return bounds;
}
} // namespace

// ---- Viewport -------------------------------------------------------------------

void FenceEngine::zoomIn() {
    if (state().viewport_.zoomIn()) recordViewportChanged();
}

void FenceEngine::zoomOut() {
    if (state().viewport_.zoomOut()) recordViewportChanged();
}

void FenceEngine::zoomAt(float screenX, float screenY, float delta) {
    if (state().viewport_.zoomAt(Point2{screenX, screenY}, delta)) recordViewportChanged();
}

void FenceEngine::zoomFit() {
    if (state().viewport_.zoomFit(sceneBounds(state().segmentStore_))) recordViewportChanged();
}

void FenceEngine::panBy(float dx, float dy) {
    if (state().viewport_.panBy(dx, dy)) recordViewportChanged();
}

void FenceEngine::setViewSize(float width, float height) {
    if (state().viewport_.setViewSize(width, height)) {
        state().config.viewport.viewWidth = width;
        state().config.viewport.viewHeight = height;
        recordViewportChanged();
    }
}

float FenceEngine::getZoom() const {
    return state().viewport_.zoom();
}

float FenceEngine::getPanX() const {
    return state().viewport_.panX();
}

float FenceEngine::getPanY() const {
    return state().viewport_.panY();
}

Point2 FenceEngine::screenToWorld(float x, float y) const {
    return state().viewport_.screenToWorld(Point2{x, y});
}

Point2 FenceEngine::worldToScreen(float x, float y) const {
    return state().viewport_.worldToScreen(Point2{x, y});
}

// ---- Calculation ----------------------------------------------------------------

void FenceEngine::tick(double nowMs) {
    EngineState& s = state();
    if (s.calculation_.tick(nowMs, s.segmentStore_, s.activeStyleId_, s.activeColorId_)) {
        recordCalculationUpdated();
    }
}

void FenceEngine::tick() {
    tick(now());
}

void FenceEngine::calculateNow() {
    EngineState& s = state();
    if (s.calculation_.flush(s.segmentStore_, s.activeStyleId_, s.activeColorId_)) {
        recordCalculationUpdated();
    }
}

const CalculationResult& FenceEngine::getCalculation() const {
    return state().calculation_.result();
}

bool FenceEngine::isCalculationPending() const {
    return state().calculation_.isScheduled() || state().calculation_.inFlightCount() > 0;
}

// ---- Sharing --------------------------------------------------------------------

std::string FenceEngine::serializeShareToken() const {
    const EngineState& s = state();
    ShareDocument doc{};
    doc.segments = s.segmentStore_.segments();
    doc.styleId = s.activeStyleId_;
    doc.colorId = s.activeColorId_;
    return encodeShareToken(doc);
}

FenceError FenceEngine::loadShareToken(const std::string& token) {
    EngineState& s = state();
    ShareDocument doc{};
    FenceError err = decodeShareToken(token, doc);
    if (err == FenceError::Ok) {
        err = s.segmentStore_.replaceAll(std::move(doc.segments));
    }
    if (err != FenceError::Ok) {
        setError(err);
        if (!pushEvent(EngineEvent{static_cast<std::uint16_t>(EventType::LoadFailed), 0, static_cast<std::uint32_t>(err), 0, 0})) {
            FENCE_LOG_DEBUG("share: LoadFailed dropped, event queue overflowed");
        }
        FENCE_LOG_WARN("share: token rejected (%s)", toString(err));
        return err;
    }

    s.interactionSession_.cancelDraft();
    s.clipboard_.clear();
    s.activeStyleId_ = doc.styleId;
    s.activeColorId_ = doc.colorId;
    if (s.selectionManager_.clearSelection()) recordSelectionChanged();

    recordSceneReplaced();
    onSceneMutated(false);
    s.historyManager_.reset(s.segmentStore_.segments());
    recordHistoryChanged();
    zoomFit();
    setError(FenceError::Ok);
    FENCE_LOG_DEBUG("share: loaded %zu segments", s.segmentStore_.size());
    return FenceError::Ok;
}

} // namespace fence
