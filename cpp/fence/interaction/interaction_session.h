#pragma once

#include "fence/config/engine_config.h"
#include "fence/core/types.h"
#include "fence/interaction/snap_types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fence {

class FenceEngine;
class SegmentStore;
class PickSystem;

enum class DrawState : std::uint8_t {
    Idle = 0,
    Drawing = 1,
};

struct DraftState {
    bool active = false;
    bool isGate = false;
    std::string styleId;
    std::string colorId;
    std::vector<Point2> points;   // committed draft vertices
    bool hasPreview = false;
    Point2 preview{0.0f, 0.0f};   // corrected pointer, not part of the scene
};

// Live length readout for the draft preview.
struct DraftDimensions {
    bool active;
    float startX, startY;
    float endX, endY;
    double previewLengthFt;
    double totalLengthFt;
    double angleDeg;
};

// Drawing state machine: Idle -> Drawing -> Idle. Every incoming point goes
// through correctPoint(); committing hands the path to the engine.
class InteractionSession {
public:
    InteractionSession(FenceEngine& engine, const SegmentStore& store, const PickSystem& pickSystem);

    SnapOptions snapOptions;

    DrawState state() const noexcept { return draft_.active ? DrawState::Drawing : DrawState::Idle; }
    bool isDraftActive() const noexcept { return draft_.active; }
    const DraftState& draft() const noexcept { return draft_; }

    void setPrecisionMode(bool enabled) { precisionMode_ = enabled; }
    bool isPrecisionMode() const noexcept { return precisionMode_; }

    // Snap used for the last draft update or hover probe.
    const SnapResult& lastSnap() const noexcept { return lastSnap_; }

    SnapResult correct(const Point2& world) const;

    void beginDraft(const Point2& world, bool isGate, const std::string& styleId, const std::string& colorId);
    void updateDraft(const Point2& world);
    void appendDraftPoint(const Point2& world);
    // Returns the new segment id, or 0 when the draft was too short.
    SegmentId commitDraft(const Point2& world);
    SegmentId commitDraftAtPreview();
    SegmentId commitDraftPrecise(double lengthFt, double angleDeg);
    void cancelDraft();

    // Magnetic target under a hovering pointer while idle.
    void probeHover(const Point2& world);

    DraftDimensions getDraftDimensions() const;

    // Pan gesture in screen space
    void beginPan(const Point2& screen);
    bool updatePan(const Point2& screen, float& dx, float& dy);
    void endPan() { panning_ = false; }
    bool isPanning() const noexcept { return panning_; }

private:
    const Point2* anchor() const;
    void pushDraftPoint(const Point2& p);
    SegmentId finish();

    FenceEngine& engine_;
    const SegmentStore& store_;
    const PickSystem& pickSystem_;

    DraftState draft_;
    SnapResult lastSnap_{};
    bool precisionMode_ = false;

    bool panning_ = false;
    Point2 panLast_{0.0f, 0.0f};
};

} // namespace fence
