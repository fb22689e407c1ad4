#pragma once

#include "fence/core/types.h"

#include <cstdint>

namespace fence {

// Which stage of point correction decided the final position.
enum class SnapKind : std::uint16_t {
    None = 0,
    Grid = 1,
    Vertex = 2,
    Intersection = 3,
    Angle = 4,
    Length = 5,
    AngleLength = 6,
};

struct SnapResult {
    Point2 point{0.0f, 0.0f};
    SnapKind kind{SnapKind::None};
    // Set for magnetic hits so a renderer can draw an indicator on the target.
    bool hasTarget{false};
    Point2 target{0.0f, 0.0f};
};

} // namespace fence
