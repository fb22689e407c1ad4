#pragma once

#include "fence/core/types.h"
#include "fence/scene/segment.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace fence {

// Authoritative, insertion-ordered list of fence segments. Lengths are always
// derived here from the path and the current grid size.
class SegmentStore {
public:
    explicit SegmentStore(float gridSize = kDefaultGridSize);

    void clear();

    // Creates a segment with a fresh id. Fails with InvalidGeometry for paths
    // shorter than 2 points or with coordinates that are non-finite or beyond
    // kMaxCoordinate, and with InvalidOperation once ids run out.
    FenceError create(std::vector<Point2> path, const std::string& styleId, const std::string& colorId,
                      bool isGate, SegmentId& outId);
    // Inserts a segment that already carries an id (paste, restore).
    FenceError insert(Segment segment);

    std::size_t removeMany(const std::vector<SegmentId>& ids);
    FenceError restyle(SegmentId id, const std::string& styleId, const std::string& colorId);

    // Replaces every segment at once. The input is validated first and the
    // store is left untouched on failure.
    FenceError replaceAll(std::vector<Segment> segments);

    const Segment* get(SegmentId id) const;
    bool contains(SegmentId id) const { return index_.find(id) != index_.end(); }
    const std::vector<Segment>& segments() const noexcept { return segments_; }
    std::size_t size() const noexcept { return segments_.size(); }
    bool empty() const noexcept { return segments_.empty(); }

    void setGridSize(float gridSize);
    float gridSize() const noexcept { return gridSize_; }

    SegmentId allocateId() { return nextId_ <= kMaxSegmentId ? nextId_++ : kInvalidSegmentId; }

    double totalLengthFt() const;
    std::size_t gateCount() const;
    std::uint32_t generation() const noexcept { return generation_; }

    static FenceError validate(const Segment& segment);

private:
    double lengthOf(const std::vector<Point2>& path) const;
    void rebuildIndex();
    void touch() { generation_++; }
    // validate() caps ids at kMaxSegmentId, so id + 1 cannot wrap.
    void noteId(SegmentId id) { nextId_ = std::max(nextId_, id + 1); }

    float gridSize_;
    std::vector<Segment> segments_;
    std::unordered_map<SegmentId, std::size_t> index_;
    SegmentId nextId_{1};
    std::uint32_t generation_{0};
};

} // namespace fence
