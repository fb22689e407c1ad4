#include "fence/interaction/snap_solver.h"
#include "fence/geometry/geometry.h"
#include "fence/interaction/pick_system.h"
#include "fence/scene/segment_store.h"

#include <cmath>
#include <limits>

namespace fence {

namespace {

struct MagneticBest {
    double dist;
    Point2 point{0.0f, 0.0f};
    SnapKind kind{SnapKind::None};
};

inline void consider(const Point2& raw, const Point2& target, SnapKind kind, MagneticBest& best) {
    const double d = geometry::distance(raw, target);
    if (d < best.dist) {
        best.dist = d;
        best.point = target;
        best.kind = kind;
    }
}

inline double wrapDegrees(double deg) {
    double w = std::fmod(deg, 360.0);
    if (w < 0.0) w += 360.0;
    return w;
}

inline double angularDistance(double a, double b) {
    const double diff = std::abs(wrapDegrees(a) - wrapDegrees(b));
    return diff > 180.0 ? 360.0 - diff : diff;
}

} // namespace

Point2 applyGridSnap(const Point2& p, float gridSize) {
    if (!(gridSize > 0.0f)) return p;
    return Point2{
        std::round(p.x / gridSize) * gridSize,
        std::round(p.y / gridSize) * gridSize,
    };
}

bool findMagneticTarget(
    const Point2& raw,
    const SegmentStore& store,
    const PickSystem* pickSystem,
    float tolerance,
    Point2& outTarget,
    SnapKind& outKind) {
    if (!(tolerance > 0.0f) || store.empty()) return false;

    std::vector<const Segment*> candidates;
    if (pickSystem) {
        std::vector<SegmentId> ids;
        pickSystem->queryArea(AABB{raw.x - tolerance, raw.y - tolerance, raw.x + tolerance, raw.y + tolerance}, ids);
        // Keep store order so ties resolve the same way with or without the index.
        for (const Segment& s : store.segments()) {
            for (SegmentId id : ids) {
                if (id == s.id) {
                    candidates.push_back(&s);
                    break;
                }
            }
        }
    } else {
        for (const Segment& s : store.segments()) candidates.push_back(&s);
    }

    MagneticBest best{static_cast<double>(tolerance)};
    for (const Segment* seg : candidates) {
        for (const Point2& v : seg->path) {
            consider(raw, v, SnapKind::Vertex, best);
        }
    }

    std::vector<Point2> crossings;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        for (std::size_t j = i + 1; j < candidates.size(); ++j) {
            crossings.clear();
            geometry::pathIntersections(candidates[i]->path, candidates[j]->path, crossings);
            for (const Point2& c : crossings) {
                consider(raw, c, SnapKind::Intersection, best);
            }
        }
    }

    if (best.kind == SnapKind::None) return false;
    outTarget = best.point;
    outKind = best.kind;
    return true;
}

bool applyAngleConstraint(const Point2& anchor, Point2& candidate, const SnapOptions& options) {
    const double dist = geometry::distance(anchor, candidate);
    if (dist <= 0.0 || options.angleConstraintsDeg.empty()) return false;

    const double angle = geometry::angleDegrees(anchor, candidate);
    double bestDiff = std::numeric_limits<double>::infinity();
    double bestAngle = angle;
    for (const float c : options.angleConstraintsDeg) {
        const double diff = angularDistance(angle, c);
        if (diff < bestDiff) {
            bestDiff = diff;
            bestAngle = c;
        }
    }
    if (!(bestDiff < options.angleThresholdDeg)) return false;

    candidate = geometry::pointAlong(anchor, bestAngle, dist);
    return true;
}

bool applyLengthConstraint(const Point2& anchor, Point2& candidate, const SnapOptions& options) {
    const double dist = geometry::distance(anchor, candidate);
    if (dist <= 0.0 || !(options.gridSize > 0.0f) || options.lengthConstraintsFt.empty()) return false;

    const double feet = dist / options.gridSize;
    double bestDiff = std::numeric_limits<double>::infinity();
    double bestLength = feet;
    for (const float len : options.lengthConstraintsFt) {
        const double diff = std::abs(feet - len);
        if (diff < bestDiff) {
            bestDiff = diff;
            bestLength = len;
        }
    }
    if (!(bestDiff < options.lengthThresholdFt)) return false;

    const double angle = geometry::angleDegrees(anchor, candidate);
    candidate = geometry::pointAlong(anchor, angle, bestLength * options.gridSize);
    return true;
}

SnapResult correctPoint(
    const Point2& raw,
    const SegmentStore& store,
    const PickSystem* pickSystem,
    const SnapOptions& options,
    bool precisionMode,
    const Point2* anchor) {
    SnapResult result{};
    result.point = raw;

    if (options.gridEnabled) {
        result.point = applyGridSnap(raw, options.gridSize);
        result.kind = SnapKind::Grid;
    }

    if (options.magneticEnabled) {
        Point2 target{};
        SnapKind kind = SnapKind::None;
        if (findMagneticTarget(raw, store, pickSystem, options.snapTolerancePx, target, kind)) {
            result.point = target;
            result.kind = kind;
            result.hasTarget = true;
            result.target = target;
            return result;
        }
    }

    if (!precisionMode || anchor == nullptr) return result;

    const bool angled = applyAngleConstraint(*anchor, result.point, options);
    const bool sized = applyLengthConstraint(*anchor, result.point, options);
    if (angled && sized) {
        result.kind = SnapKind::AngleLength;
    } else if (angled) {
        result.kind = SnapKind::Angle;
    } else if (sized) {
        result.kind = SnapKind::Length;
    }
    return result;
}

} // namespace fence
