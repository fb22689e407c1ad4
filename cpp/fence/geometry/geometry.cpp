#include "fence/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace fence::geometry {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

double distanceSq(const Point2& a, const Point2& b) {
    const double dx = static_cast<double>(b.x) - a.x;
    const double dy = static_cast<double>(b.y) - a.y;
    return dx * dx + dy * dy;
}

double distance(const Point2& a, const Point2& b) {
    return std::sqrt(distanceSq(a, b));
}

double pathLength(const std::vector<Point2>& points) {
    double total = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        total += distance(points[i - 1], points[i]);
    }
    return total;
}

std::optional<Point2> segmentIntersection(const Point2& p1, const Point2& p2, const Point2& p3, const Point2& p4) {
    const double d1x = static_cast<double>(p2.x) - p1.x;
    const double d1y = static_cast<double>(p2.y) - p1.y;
    const double d2x = static_cast<double>(p4.x) - p3.x;
    const double d2y = static_cast<double>(p4.y) - p3.y;

    const double det = d1x * d2y - d1y * d2x;
    if (std::abs(det) < kParallelEpsilon) return std::nullopt;

    const double dx = static_cast<double>(p3.x) - p1.x;
    const double dy = static_cast<double>(p3.y) - p1.y;
    const double t = (dx * d2y - dy * d2x) / det;
    const double u = (dx * d1y - dy * d1x) / det;
    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) return std::nullopt;

    return Point2{
        static_cast<float>(p1.x + t * d1x),
        static_cast<float>(p1.y + t * d1y),
    };
}

void pathIntersections(const std::vector<Point2>& a, const std::vector<Point2>& b, std::vector<Point2>& out) {
    for (std::size_t i = 1; i < a.size(); ++i) {
        for (std::size_t j = 1; j < b.size(); ++j) {
            if (const auto hit = segmentIntersection(a[i - 1], a[i], b[j - 1], b[j])) {
                out.push_back(*hit);
            }
        }
    }
}

double turnAngleDegrees(const std::vector<Point2>& path, std::size_t index) {
    if (path.size() < 3 || index == 0 || index + 1 >= path.size()) return 0.0;
    const double inAngle = std::atan2(
        static_cast<double>(path[index].y) - path[index - 1].y,
        static_cast<double>(path[index].x) - path[index - 1].x);
    const double outAngle = std::atan2(
        static_cast<double>(path[index + 1].y) - path[index].y,
        static_cast<double>(path[index + 1].x) - path[index].x);
    double diff = std::abs(outAngle - inAngle);
    if (diff > kPi) diff = 2.0 * kPi - diff;
    return diff * 180.0 / kPi;
}

bool isCornerPoint(const std::vector<Point2>& path, std::size_t index) {
    return turnAngleDegrees(path, index) > kCornerAngleDeg;
}

std::size_t countCornerPoints(const std::vector<Point2>& path) {
    std::size_t count = 0;
    for (std::size_t i = 1; i + 1 < path.size(); ++i) {
        if (isCornerPoint(path, i)) count++;
    }
    return count;
}

Point2 midPoint(const std::vector<Point2>& points) {
    if (points.empty()) return Point2{0.0f, 0.0f};
    if (points.size() == 1) return points.front();
    if (points.size() == 2) {
        return Point2{(points[0].x + points[1].x) * 0.5f, (points[0].y + points[1].y) * 0.5f};
    }

    const double half = pathLength(points) * 0.5;
    double walked = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        const double len = distance(points[i - 1], points[i]);
        if (len > 0.0 && walked + len >= half) {
            const double t = (half - walked) / len;
            return Point2{
                static_cast<float>(points[i - 1].x + t * (static_cast<double>(points[i].x) - points[i - 1].x)),
                static_cast<float>(points[i - 1].y + t * (static_cast<double>(points[i].y) - points[i - 1].y)),
            };
        }
        walked += len;
    }
    return points[points.size() / 2];
}

double angleDegrees(const Point2& from, const Point2& to) {
    return std::atan2(static_cast<double>(to.y) - from.y, static_cast<double>(to.x) - from.x) * 180.0 / kPi;
}

Point2 pointAlong(const Point2& from, double angleDeg, double dist) {
    const double rad = angleDeg * kPi / 180.0;
    return Point2{
        static_cast<float>(from.x + std::cos(rad) * dist),
        static_cast<float>(from.y + std::sin(rad) * dist),
    };
}

double distanceToSegmentSq(const Point2& p, const Point2& a, const Point2& b) {
    const double l2 = distanceSq(a, b);
    if (l2 == 0.0) return distanceSq(p, a);
    double t = ((static_cast<double>(p.x) - a.x) * (static_cast<double>(b.x) - a.x)
        + (static_cast<double>(p.y) - a.y) * (static_cast<double>(b.y) - a.y)) / l2;
    t = std::max(0.0, std::min(1.0, t));
    const double cx = a.x + t * (static_cast<double>(b.x) - a.x);
    const double cy = a.y + t * (static_cast<double>(b.y) - a.y);
    const double dx = p.x - cx;
    const double dy = p.y - cy;
    return dx * dx + dy * dy;
}

double distanceToPolyline(const Point2& p, const std::vector<Point2>& path, std::size_t* edgeIndex) {
    if (path.empty()) return std::numeric_limits<double>::infinity();
    if (path.size() == 1) {
        if (edgeIndex) *edgeIndex = 0;
        return distance(p, path.front());
    }
    double best = std::numeric_limits<double>::infinity();
    std::size_t bestEdge = 0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        const double d = distanceToSegmentSq(p, path[i - 1], path[i]);
        if (d < best) {
            best = d;
            bestEdge = i - 1;
        }
    }
    if (edgeIndex) *edgeIndex = bestEdge;
    return std::sqrt(best);
}

void expandBounds(Bounds2& bounds, const Point2& p) {
    if (!bounds.valid) {
        bounds = Bounds2{p.x, p.y, p.x, p.y, true};
        return;
    }
    bounds.minX = std::min(bounds.minX, p.x);
    bounds.minY = std::min(bounds.minY, p.y);
    bounds.maxX = std::max(bounds.maxX, p.x);
    bounds.maxY = std::max(bounds.maxY, p.y);
}

Bounds2 pathBounds(const std::vector<Point2>& path) {
    Bounds2 bounds{0.0f, 0.0f, 0.0f, 0.0f, false};
    for (const Point2& p : path) expandBounds(bounds, p);
    return bounds;
}

bool isFinitePoint(const Point2& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

} // namespace fence::geometry
