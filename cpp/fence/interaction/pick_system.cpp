#include "fence/interaction/pick_system.h"
#include "fence/geometry/geometry.h"
#include "fence/scene/segment_store.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace fence {

// SpatialHashGrid Implementation

namespace {
constexpr double kCellCoordLimit = 16777216.0; // 2^24
}

SpatialHashGrid::SpatialHashGrid(float cellSize) : cellSize_(cellSize) {}

std::int64_t SpatialHashGrid::hash(int ix, int iy) const {
    return (static_cast<std::int64_t>(ix) * 73856093) ^ (static_cast<std::int64_t>(iy) * 19349663);
}

int SpatialHashGrid::cellCoord(float v) const {
    const double c = std::floor(static_cast<double>(v) / static_cast<double>(cellSize_));
    if (!std::isfinite(c)) return c > 0.0 ? static_cast<int>(kCellCoordLimit) : static_cast<int>(-kCellCoordLimit);
    return static_cast<int>(std::clamp(c, -kCellCoordLimit, kCellCoordLimit));
}

std::int64_t SpatialHashGrid::CellRange::count() const {
    return (static_cast<std::int64_t>(maxX) - minX + 1) * (static_cast<std::int64_t>(maxY) - minY + 1);
}

SpatialHashGrid::CellRange SpatialHashGrid::cellRange(const AABB& bounds) const {
    return CellRange{cellCoord(bounds.minX), cellCoord(bounds.minY), cellCoord(bounds.maxX), cellCoord(bounds.maxY)};
}

void SpatialHashGrid::insert(SegmentId id, const AABB& bounds) {
    all_.push_back(id);
    const CellRange r = cellRange(bounds);
    if (r.maxX < r.minX || r.maxY < r.minY || r.count() > kMaxCellsPerEntry) {
        overflow_.push_back(id);
        return;
    }
    for (int x = r.minX; x <= r.maxX; ++x) {
        for (int y = r.minY; y <= r.maxY; ++y) {
            cells_[hash(x, y)].push_back(id);
        }
    }
}

void SpatialHashGrid::clear() {
    cells_.clear();
    overflow_.clear();
    all_.clear();
}

void SpatialHashGrid::query(const AABB& bounds, std::vector<SegmentId>& results) const {
    const CellRange r = cellRange(bounds);
    if (r.maxX < r.minX || r.maxY < r.minY) return;
    if (r.count() > kMaxCellsPerEntry) {
        results.insert(results.end(), all_.begin(), all_.end());
        return;
    }
    results.insert(results.end(), overflow_.begin(), overflow_.end());
    for (int x = r.minX; x <= r.maxX; ++x) {
        for (int y = r.minY; y <= r.maxY; ++y) {
            auto it = cells_.find(hash(x, y));
            if (it != cells_.end()) {
                results.insert(results.end(), it->second.begin(), it->second.end());
            }
        }
    }
}

// PickSystem Implementation

PickSystem::PickSystem() : index_(100.0f) {}

void PickSystem::rebuild(const SegmentStore& store) {
    index_.clear();
    for (const Segment& s : store.segments()) {
        index_.insert(s.id, computeSegmentAABB(s));
    }
}

AABB PickSystem::computeSegmentAABB(const Segment& segment) {
    const Bounds2 b = geometry::pathBounds(segment.path);
    if (!b.valid) return AABB{0.0f, 0.0f, 0.0f, 0.0f};
    return AABB{b.minX, b.minY, b.maxX, b.maxY};
}

void PickSystem::queryArea(const AABB& area, std::vector<SegmentId>& outResults) const {
    std::vector<SegmentId> raw;
    index_.query(area, raw);
    std::unordered_set<SegmentId> seen;
    for (SegmentId id : raw) {
        if (seen.insert(id).second) outResults.push_back(id);
    }
}

PickResult PickSystem::pick(float x, float y, float tolerancePx, float viewScale, const SegmentStore& store) const {
    PickResult result{kInvalidSegmentId, -1, std::numeric_limits<float>::infinity(), x, y};
    const float tol = viewScale > 1e-6f ? tolerancePx / viewScale : tolerancePx;

    std::vector<SegmentId> candidates;
    queryArea(AABB{x - tol, y - tol, x + tol, y + tol}, candidates);

    const auto& segments = store.segments();
    std::size_t bestOrder = 0;
    const Point2 p{x, y};
    for (SegmentId id : candidates) {
        const Segment* seg = store.get(id);
        if (!seg) continue;
        std::size_t edge = 0;
        const float d = static_cast<float>(geometry::distanceToPolyline(p, seg->path, &edge));
        if (d > tol) continue;

        const std::size_t order = static_cast<std::size_t>(seg - segments.data());
        const bool better = d < result.distance || (d == result.distance && order > bestOrder);
        if (better) {
            result.id = id;
            result.edgeIndex = static_cast<std::int32_t>(edge);
            result.distance = d;
            bestOrder = order;
        }
    }
    return result;
}

} // namespace fence
