#include "fence/interaction/interaction_session.h"
#include "fence/core/logging.h"
#include "fence/engine.h"
#include "fence/geometry/geometry.h"
#include "fence/interaction/snap_solver.h"
#include "fence/scene/segment_store.h"

#include <cmath>
#include <utility>

namespace fence {

InteractionSession::InteractionSession(FenceEngine& engine, const SegmentStore& store, const PickSystem& pickSystem)
    : engine_(engine), store_(store), pickSystem_(pickSystem) {}

const Point2* InteractionSession::anchor() const {
    if (!draft_.active || draft_.points.empty()) return nullptr;
    return &draft_.points.back();
}

SnapResult InteractionSession::correct(const Point2& world) const {
    return correctPoint(world, store_, &pickSystem_, snapOptions, precisionMode_, anchor());
}

void InteractionSession::pushDraftPoint(const Point2& p) {
    // Repeated clicks on the same spot do not add zero-length edges.
    if (!draft_.points.empty() && draft_.points.back() == p) return;
    draft_.points.push_back(p);
}

void InteractionSession::beginDraft(const Point2& world, bool isGate, const std::string& styleId, const std::string& colorId) {
    if (draft_.active) cancelDraft();

    draft_ = DraftState{};
    draft_.active = true;
    draft_.isGate = isGate;
    draft_.styleId = styleId;
    draft_.colorId = colorId;

    lastSnap_ = correct(world);
    draft_.points.push_back(lastSnap_.point);
    draft_.hasPreview = false;
    engine_.recordDraftChanged();
}

void InteractionSession::updateDraft(const Point2& world) {
    if (!draft_.active) return;
    lastSnap_ = correct(world);
    draft_.preview = lastSnap_.point;
    draft_.hasPreview = true;
    engine_.recordDraftChanged();
}

void InteractionSession::appendDraftPoint(const Point2& world) {
    if (!draft_.active) return;
    lastSnap_ = correct(world);
    pushDraftPoint(lastSnap_.point);
    draft_.hasPreview = false;
    engine_.recordDraftChanged();
}

SegmentId InteractionSession::commitDraft(const Point2& world) {
    if (!draft_.active) return kInvalidSegmentId;
    lastSnap_ = correct(world);
    pushDraftPoint(lastSnap_.point);
    return finish();
}

SegmentId InteractionSession::commitDraftAtPreview() {
    if (!draft_.active) return kInvalidSegmentId;
    if (draft_.hasPreview) pushDraftPoint(draft_.preview);
    return finish();
}

SegmentId InteractionSession::commitDraftPrecise(double lengthFt, double angleDeg) {
    if (!draft_.active || draft_.points.empty()) return kInvalidSegmentId;
    if (!std::isfinite(lengthFt) || !std::isfinite(angleDeg)) return kInvalidSegmentId;
    if (lengthFt <= 0.0 || lengthFt > kMaxPrecisionLengthFt) return kInvalidSegmentId;
    const Point2 end = geometry::pointAlong(draft_.points.back(), angleDeg, lengthFt * snapOptions.gridSize);
    pushDraftPoint(end);
    return finish();
}

SegmentId InteractionSession::finish() {
    DraftState done = std::move(draft_);
    draft_ = DraftState{};
    lastSnap_ = SnapResult{};
    engine_.recordDraftChanged();

    if (done.points.size() < 2) {
        FENCE_LOG_DEBUG("draft: discarded with %zu point(s)", done.points.size());
        return kInvalidSegmentId;
    }
    return engine_.commitDraftSegment(std::move(done.points), done.isGate, done.styleId, done.colorId);
}

void InteractionSession::cancelDraft() {
    if (!draft_.active) return;
    draft_ = DraftState{};
    lastSnap_ = SnapResult{};
    engine_.recordDraftChanged();
}

void InteractionSession::probeHover(const Point2& world) {
    lastSnap_ = SnapResult{};
    if (!snapOptions.magneticEnabled) return;
    Point2 target{};
    SnapKind kind = SnapKind::None;
    if (findMagneticTarget(world, store_, &pickSystem_, snapOptions.snapTolerancePx, target, kind)) {
        lastSnap_.point = target;
        lastSnap_.kind = kind;
        lastSnap_.hasTarget = true;
        lastSnap_.target = target;
    }
}

DraftDimensions InteractionSession::getDraftDimensions() const {
    DraftDimensions dims{false, 0.0f, 0.0f, 0.0f, 0.0f, 0.0, 0.0, 0.0};
    if (!draft_.active || draft_.points.empty()) return dims;

    const Point2& last = draft_.points.back();
    const Point2 end = draft_.hasPreview ? draft_.preview : last;
    const double grid = snapOptions.gridSize > 0.0f ? snapOptions.gridSize : kDefaultGridSize;

    dims.active = true;
    dims.startX = last.x;
    dims.startY = last.y;
    dims.endX = end.x;
    dims.endY = end.y;
    dims.previewLengthFt = geometry::distance(last, end) / grid;
    dims.totalLengthFt = geometry::pathLength(draft_.points) / grid + dims.previewLengthFt;
    dims.angleDeg = geometry::angleDegrees(last, end);
    return dims;
}

void InteractionSession::beginPan(const Point2& screen) {
    panning_ = true;
    panLast_ = screen;
}

bool InteractionSession::updatePan(const Point2& screen, float& dx, float& dy) {
    if (!panning_) return false;
    dx = screen.x - panLast_.x;
    dy = screen.y - panLast_.y;
    panLast_ = screen;
    return dx != 0.0f || dy != 0.0f;
}

} // namespace fence
