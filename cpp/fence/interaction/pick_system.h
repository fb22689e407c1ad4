#pragma once

#include "fence/core/types.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace fence {

class SegmentStore;
struct Segment;

struct AABB {
    float minX, minY, maxX, maxY;
};

// Return struct for picking
struct PickResult {
    SegmentId id;            // 0 when nothing was hit
    std::int32_t edgeIndex;  // sub-segment of the path, -1 on miss
    float distance;
    float hitX, hitY;        // World point that was tested
};

// Entries spanning more than kMaxCellsPerEntry cells are kept in an overflow
// list that every query scans. Queries wider than that return every entry.
class SpatialHashGrid {
public:
    static constexpr std::int64_t kMaxCellsPerEntry = 256;

    explicit SpatialHashGrid(float cellSize);
    void insert(SegmentId id, const AABB& bounds);
    void clear();
    void query(const AABB& bounds, std::vector<SegmentId>& results) const;

    std::size_t overflowCount() const noexcept { return overflow_.size(); }

private:
    struct CellRange {
        int minX, minY, maxX, maxY;
        std::int64_t count() const;
    };

    CellRange cellRange(const AABB& bounds) const;
    int cellCoord(float v) const;
    std::int64_t hash(int x, int y) const;

    float cellSize_;
    // Cell key -> ids overlapping that cell
    std::unordered_map<std::int64_t, std::vector<SegmentId>> cells_;
    std::vector<SegmentId> overflow_;
    std::vector<SegmentId> all_;
};

// Broad-phase index over segment bounds plus the narrow-phase distance test
// used for click selection and magnetic snapping.
class PickSystem {
public:
    PickSystem();

    void rebuild(const SegmentStore& store);

    static AABB computeSegmentAABB(const Segment& segment);

    // `tolerancePx` is in screen pixels and is divided by the view scale.
    // The last-drawn segment wins ties.
    PickResult pick(float x, float y, float tolerancePx, float viewScale, const SegmentStore& store) const;

    // Ids whose bounds overlap `area`, deduplicated, in no particular order.
    void queryArea(const AABB& area, std::vector<SegmentId>& outResults) const;

    const SpatialHashGrid& index() const noexcept { return index_; }

private:
    SpatialHashGrid index_;
};

} // namespace fence
