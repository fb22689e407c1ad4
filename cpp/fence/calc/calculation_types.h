#pragma once

#include "fence/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fence {

struct Materials {
    std::uint32_t panels{0};
    std::uint32_t posts{0};
    std::uint32_t hardware{0};
    std::uint32_t gates{0};
};

struct CostBreakdown {
    double materialCost{0.0};
    double laborCost{0.0};
    double gateCost{0.0};
    double totalCost{0.0};
    double costPerFoot{0.0};
};

// Counts taken from the scene, independent of who priced it.
struct Measurements {
    double totalLengthFt{0.0};
    std::uint32_t segmentCount{0};
    std::uint32_t gateCount{0};
    std::uint32_t cornerCount{0};
};

enum class CalculationSource : std::uint32_t {
    None = 0,     // nothing computed yet
    Empty = 1,    // scene was empty, no request issued
    Service = 2,
    Fallback = 3,
};

struct CalculationResult {
    Measurements measurements{};
    Materials materials{};
    CostBreakdown cost{};
    CalculationSource source{CalculationSource::None};
    std::uint64_t requestToken{0};
};

struct EstimateSegment {
    std::vector<Point2> path;
    std::string style;
    std::string color;
    double length{0.0};
    bool isGate{false};
    float scale{kDefaultGridSize};
};

struct EstimateRequest {
    std::uint64_t token{0};
    std::string fenceType;
    std::string color;
    std::vector<EstimateSegment> segments;
};

struct EstimateReply {
    FenceError status{FenceError::EstimatorUnavailable};
    Materials materials{};
    CostBreakdown cost{};
    std::string detail; // transport or parse message for logging
};

} // namespace fence
