#pragma once

#include "fence/core/types.h"

#include <optional>
#include <vector>

// Pure 2D helpers over world-space points. Nothing here touches engine state.
namespace fence::geometry {

// Determinant magnitude under which two segments are treated as parallel.
constexpr double kParallelEpsilon = 1e-10;
// Turn angle (degrees) above which a vertex counts as a corner post.
constexpr double kCornerAngleDeg = 30.0;

double distance(const Point2& a, const Point2& b);
double distanceSq(const Point2& a, const Point2& b);

// Sum of consecutive distances; 0 for fewer than 2 points.
double pathLength(const std::vector<Point2>& points);

// Crossing point of the finite segments p1-p2 and p3-p4, or nothing when they
// are parallel or the crossing lies outside either segment.
std::optional<Point2> segmentIntersection(const Point2& p1, const Point2& p2, const Point2& p3, const Point2& p4);

// Every crossing between any sub-segment of `a` and any sub-segment of `b`.
void pathIntersections(const std::vector<Point2>& a, const std::vector<Point2>& b, std::vector<Point2>& out);

// Turn at `index` (interior vertices only) wrapped into [0, 180] degrees.
double turnAngleDegrees(const std::vector<Point2>& path, std::size_t index);
bool isCornerPoint(const std::vector<Point2>& path, std::size_t index);
std::size_t countCornerPoints(const std::vector<Point2>& path);

// Point at half the cumulative length. Falls back to the middle element when
// the path has no length.
Point2 midPoint(const std::vector<Point2>& points);

// Direction of `to` as seen from `from`, degrees in (-180, 180].
double angleDegrees(const Point2& from, const Point2& to);
Point2 pointAlong(const Point2& from, double angleDeg, double dist);

double distanceToSegmentSq(const Point2& p, const Point2& a, const Point2& b);
// Returns the smallest distance and the index of the sub-segment it was found on.
double distanceToPolyline(const Point2& p, const std::vector<Point2>& path, std::size_t* edgeIndex = nullptr);

Bounds2 pathBounds(const std::vector<Point2>& path);
void expandBounds(Bounds2& bounds, const Point2& p);

bool isFinitePoint(const Point2& p);

} // namespace fence::geometry
