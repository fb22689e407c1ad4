#include "fence/calc/fallback_estimator.h"

#include <cmath>

namespace fence {

Measurements measureSegments(const std::vector<Segment>& segments) {
    Measurements m{};
    for (const Segment& s : segments) {
        m.totalLengthFt += s.length;
        m.segmentCount++;
        if (s.isGate) m.gateCount++;
        if (s.path.size() > 2) m.cornerCount += static_cast<std::uint32_t>(s.path.size() - 2);
    }
    return m;
}

void computeFallbackEstimate(const Measurements& m, const FallbackPricing& pricing, Materials& outMaterials, CostBreakdown& outCost) {
    const double length = m.totalLengthFt;
    // Guard against 10.000001 ft rounding up to an extra panel.
    const double panelsExact = length / pricing.panelLengthFt;
    const double panels = length > 0.0 ? std::ceil(panelsExact - 1e-9) : 0.0;

    outMaterials.panels = static_cast<std::uint32_t>(panels);
    outMaterials.posts = outMaterials.panels + 1;
    outMaterials.hardware = static_cast<std::uint32_t>(panels * pricing.hardwarePerPanel);
    outMaterials.gates = m.gateCount;

    outCost.materialCost = length * pricing.materialPerFt;
    outCost.laborCost = length * pricing.laborPerFt;
    outCost.gateCost = static_cast<double>(m.gateCount) * pricing.perGate;
    outCost.totalCost = outCost.materialCost + outCost.laborCost + outCost.gateCost;
    outCost.costPerFoot = length > 0.0 ? outCost.totalCost / length : 0.0;
}

} // namespace fence
