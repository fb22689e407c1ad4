#pragma once

#include "fence/config/engine_config.h"
#include "fence/core/types.h"
#include "fence/interaction/snap_types.h"

#include <vector>

namespace fence {

class PickSystem;
class SegmentStore;

// Rounds each axis independently to the nearest multiple of `gridSize`.
Point2 applyGridSnap(const Point2& p, float gridSize);

// Nearest existing vertex or pairwise segment intersection strictly closer
// than `tolerance` to `raw`. Vertices win ties over intersections. When
// `pickSystem` is null every segment is scanned.
bool findMagneticTarget(
    const Point2& raw,
    const SegmentStore& store,
    const PickSystem* pickSystem,
    float tolerance,
    Point2& outTarget,
    SnapKind& outKind);

// Moves `candidate` onto the nearest canonical ray from `anchor` when within
// the threshold. Angles are compared with wrap-around.
bool applyAngleConstraint(const Point2& anchor, Point2& candidate, const SnapOptions& options);

// Moves `candidate` to the nearest standard length (feet) from `anchor` along
// its current direction when within the threshold.
bool applyLengthConstraint(const Point2& anchor, Point2& candidate, const SnapOptions& options);

// Full pipeline: grid -> magnetic (final when hit) -> angle -> length. The
// constraint stages run only when `precisionMode` is set and `anchor` (the
// last committed draft point) is given.
SnapResult correctPoint(
    const Point2& raw,
    const SegmentStore& store,
    const PickSystem* pickSystem,
    const SnapOptions& options,
    bool precisionMode,
    const Point2* anchor);

} // namespace fence
