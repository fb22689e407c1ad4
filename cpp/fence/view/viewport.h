#pragma once

#include "fence/config/engine_config.h"
#include "fence/core/types.h"

namespace fence {

// Screen/world transform: screen = world * zoom + pan. Every mutator returns
// true when the transform actually changed.
class Viewport {
public:
    explicit Viewport(const ViewportOptions& options = ViewportOptions{});

    float zoom() const noexcept { return zoom_; }
    float panX() const noexcept { return panX_; }
    float panY() const noexcept { return panY_; }
    float viewWidth() const noexcept { return options_.viewWidth; }
    float viewHeight() const noexcept { return options_.viewHeight; }

    void setOptions(const ViewportOptions& options);
    bool setViewSize(float width, float height);
    bool setTransform(float zoom, float panX, float panY);
    bool reset();

    bool zoomIn();
    bool zoomOut();
    // Adds `delta` to the zoom and keeps the world point under `screenPoint` fixed.
    bool zoomAt(const Point2& screenPoint, float delta);
    // Fits `bounds` (world) plus padding into the view. Invalid bounds reset
    // to the identity transform.
    bool zoomFit(const Bounds2& bounds);
    bool panBy(float dx, float dy);

    Point2 screenToWorld(const Point2& screen) const;
    Point2 worldToScreen(const Point2& world) const;

private:
    float clampZoom(float z) const;
    bool assign(float zoom, float panX, float panY);

    ViewportOptions options_;
    float zoom_{1.0f};
    float panX_{0.0f};
    float panY_{0.0f};
};

} // namespace fence
