#pragma once

#include "fence/core/types.h"

#include <string>
#include <vector>

namespace fence {

struct Segment {
    SegmentId id{kInvalidSegmentId};
    std::vector<Point2> path;
    std::string styleId;
    std::string colorId;
    bool isGate{false};
    double length{0.0}; // feet, derived from path by SegmentStore
};

inline bool sameGeometryAndStyle(const Segment& a, const Segment& b) {
    return a.id == b.id && a.path == b.path && a.styleId == b.styleId
        && a.colorId == b.colorId && a.isGate == b.isGate;
}

} // namespace fence
