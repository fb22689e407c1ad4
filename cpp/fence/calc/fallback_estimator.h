#pragma once

#include "fence/calc/calculation_types.h"
#include "fence/config/engine_config.h"
#include "fence/scene/segment.h"

#include <vector>

namespace fence {

// cornerCount counts every interior vertex, max(0, path.size() - 2) per segment.
Measurements measureSegments(const std::vector<Segment>& segments);

// Deterministic local estimate used whenever the estimator cannot answer.
void computeFallbackEstimate(const Measurements& m, const FallbackPricing& pricing, Materials& outMaterials, CostBreakdown& outCost);

} // namespace fence
