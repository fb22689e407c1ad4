#include "fence/render/render.h"
#include "fence/config/engine_config.h"
#include "fence/geometry/geometry.h"
#include "fence/interaction/interaction_session.h"
#include "fence/scene/segment_store.h"
#include "fence/scene/selection_manager.h"
#include "fence/view/viewport.h"

#include <cstdio>

namespace fence {

namespace {

SegmentVisual buildSegmentVisual(const Segment& seg, bool selected, const EngineConfig& config) {
    SegmentVisual v{};
    v.id = seg.id;
    v.path = seg.path;
    v.stroke = config.colorSwatch(seg.colorId);
    v.strokeWidth = seg.isGate ? kGateStrokeWidth : kFenceStrokeWidth;
    if (seg.isGate) v.dash = {10.0f, 5.0f};
    v.selected = selected;
    v.isGate = seg.isGate;

    v.posts.push_back(PostMarker{seg.path.front(), PostKind::End});
    for (std::size_t i = 1; i + 1 < seg.path.size(); ++i) {
        if (geometry::isCornerPoint(seg.path, i)) {
            v.posts.push_back(PostMarker{seg.path[i], PostKind::Corner});
        }
    }
    v.posts.push_back(PostMarker{seg.path.back(), PostKind::End});

    v.lengthLabel = TextLabel{geometry::midPoint(seg.path), formatFeet(seg.length)};
    return v;
}

void appendDimensions(const Segment& seg, float gridSize, std::vector<DimensionLine>& out) {
    for (std::size_t i = 1; i < seg.path.size(); ++i) {
        const Point2& a = seg.path[i - 1];
        const Point2& b = seg.path[i];
        DimensionLine line{};
        line.from = Point2{a.x, a.y - kDimensionOffset};
        line.to = Point2{b.x, b.y - kDimensionOffset};
        const double feet = geometry::distance(a, b) / gridSize;
        line.label = TextLabel{
            Point2{(a.x + b.x) * 0.5f, (a.y + b.y) * 0.5f - kDimensionOffset - 5.0f},
            formatFeet(feet),
        };
        out.push_back(std::move(line));
    }
}

} // namespace

std::string formatFeet(double feet) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f ft", feet);
    return std::string(buf);
}

RenderScene buildRenderScene(
    const SegmentStore& store,
    const SelectionManager& selection,
    const InteractionSession& session,
    const Viewport& viewport,
    const EngineConfig& config) {
    RenderScene scene{};
    scene.segments.reserve(store.size());
    for (const Segment& seg : store.segments()) {
        scene.segments.push_back(buildSegmentVisual(seg, selection.isSelected(seg.id), config));
        if (config.edit.showDimensions) {
            appendDimensions(seg, store.gridSize(), scene.dimensions);
        }
    }

    const DraftState& draft = session.draft();
    scene.draft.active = draft.active;
    scene.draft.isGate = draft.isGate;
    if (draft.active) {
        scene.draft.path = draft.points;
        if (draft.hasPreview) scene.draft.path.push_back(draft.preview);
        const DraftDimensions dims = session.getDraftDimensions();
        scene.draft.lengthLabel = TextLabel{Point2{dims.endX, dims.endY}, formatFeet(dims.totalLengthFt)};
    }

    const SnapResult& snap = session.lastSnap();
    scene.snap = SnapIndicator{snap.hasTarget, snap.target, snap.kind};

    scene.view = ViewTransform{viewport.zoom(), viewport.panX(), viewport.panY(), viewport.viewWidth(), viewport.viewHeight()};
    return scene;
}

} // namespace fence
