#include "fence/view/viewport.h"

#include <algorithm>
#include <cmath>

namespace fence {

Viewport::Viewport(const ViewportOptions& options)
    : options_(options) {}

void Viewport::setOptions(const ViewportOptions& options) {
    options_ = options;
    zoom_ = clampZoom(zoom_);
}

float Viewport::clampZoom(float z) const {
    return std::max(options_.minZoom, std::min(options_.maxZoom, z));
}

bool Viewport::assign(float zoom, float panX, float panY) {
    if (!std::isfinite(zoom) || !std::isfinite(panX) || !std::isfinite(panY)) return false;
    zoom = clampZoom(zoom);
    if (zoom == zoom_ && panX == panX_ && panY == panY_) return false;
    zoom_ = zoom;
    panX_ = panX;
    panY_ = panY;
    return true;
}

bool Viewport::setViewSize(float width, float height) {
    if (!(width > 0.0f) || !(height > 0.0f)) return false;
    if (width == options_.viewWidth && height == options_.viewHeight) return false;
    options_.viewWidth = width;
    options_.viewHeight = height;
    return true;
}

bool Viewport::setTransform(float zoom, float panX, float panY) {
    return assign(zoom, panX, panY);
}

bool Viewport::reset() {
    return assign(1.0f, 0.0f, 0.0f);
}

bool Viewport::zoomIn() {
    return assign(zoom_ * options_.zoomStep, panX_, panY_);
}

bool Viewport::zoomOut() {
    return assign(zoom_ / options_.zoomStep, panX_, panY_);
}

bool Viewport::zoomAt(const Point2& screenPoint, float delta) {
    const float oldZoom = zoom_;
    const float next = clampZoom(zoom_ + delta);
    if (next == oldZoom) return false;

    const float ratio = next / oldZoom;
    const float px = screenPoint.x - (screenPoint.x - panX_) * ratio;
    const float py = screenPoint.y - (screenPoint.y - panY_) * ratio;
    return assign(next, px, py);
}

bool Viewport::zoomFit(const Bounds2& bounds) {
    if (!bounds.valid) return reset();

    const float pad = options_.fitPadding;
    const float minX = bounds.minX - pad;
    const float minY = bounds.minY - pad;
    const float width = (bounds.maxX + pad) - minX;
    const float height = (bounds.maxY + pad) - minY;

    float zoom = options_.fitMaxZoom;
    if (width > 0.0f) zoom = std::min(zoom, options_.viewWidth / width);
    if (height > 0.0f) zoom = std::min(zoom, options_.viewHeight / height);
    zoom = clampZoom(zoom);

    const float centerX = minX + width * 0.5f;
    const float centerY = minY + height * 0.5f;
    return assign(zoom,
        options_.viewWidth * 0.5f - centerX * zoom,
        options_.viewHeight * 0.5f - centerY * zoom);
}

bool Viewport::panBy(float dx, float dy) {
    return assign(zoom_, panX_ + dx, panY_ + dy);
}

Point2 Viewport::screenToWorld(const Point2& screen) const {
    return Point2{(screen.x - panX_) / zoom_, (screen.y - panY_) / zoom_};
}

Point2 Viewport::worldToScreen(const Point2& world) const {
    return Point2{world.x * zoom_ + panX_, world.y * zoom_ + panY_};
}

} // namespace fence
