#pragma once

#include "fence/scene/segment.h"

#include <vector>

namespace fence {

// Immutable deep copy of the segment list at one point in time.
struct HistoryEntry {
    std::vector<Segment> segments;
};

} // namespace fence
