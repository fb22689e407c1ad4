#pragma once

#include "fence/core/types.h"
#include "fence/interaction/snap_types.h"

#include <string>
#include <vector>

namespace fence {

class SegmentStore;
class SelectionManager;
class Viewport;
class InteractionSession;
struct EngineConfig;

enum class PostKind : std::uint8_t {
    End = 0,
    Corner = 1,
};

struct PostMarker {
    Point2 at;
    PostKind kind;
};

struct TextLabel {
    Point2 at;
    std::string text;
};

struct DimensionLine {
    Point2 from;
    Point2 to;
    TextLabel label;
};

struct SegmentVisual {
    SegmentId id;
    std::vector<Point2> path;
    std::string stroke;          // "#rrggbb"
    float strokeWidth;
    std::vector<float> dash;     // empty = solid
    bool selected;
    bool isGate;
    std::vector<PostMarker> posts;
    TextLabel lengthLabel;
};

struct DraftVisual {
    bool active;
    bool isGate;
    std::vector<Point2> path;    // committed vertices followed by the preview point
    TextLabel lengthLabel;
};

struct SnapIndicator {
    bool visible;
    Point2 at;
    SnapKind kind;
};

struct ViewTransform {
    float zoom;
    float panX;
    float panY;
    float viewWidth;
    float viewHeight;
};

struct RenderScene {
    std::vector<SegmentVisual> segments;
    std::vector<DimensionLine> dimensions;
    DraftVisual draft;
    SnapIndicator snap;
    ViewTransform view;
};

constexpr float kFenceStrokeWidth = 4.0f;
constexpr float kGateStrokeWidth = 6.0f;
constexpr float kDimensionOffset = 20.0f;

// "12.5 ft" style label with one decimal.
std::string formatFeet(double feet);

RenderScene buildRenderScene(
    const SegmentStore& store,
    const SelectionManager& selection,
    const InteractionSession& session,
    const Viewport& viewport,
    const EngineConfig& config);

} // namespace fence
