#include "fence/scene/segment_store.h"
#include "fence/core/logging.h"
#include "fence/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace fence {

SegmentStore::SegmentStore(float gridSize)
    : gridSize_(gridSize > 0.0f ? gridSize : kDefaultGridSize) {}

void SegmentStore::clear() {
    segments_.clear();
    index_.clear();
    touch();
}

double SegmentStore::lengthOf(const std::vector<Point2>& path) const {
    return geometry::pathLength(path) / static_cast<double>(gridSize_);
}

FenceError SegmentStore::validate(const Segment& segment) {
    if (segment.id == kInvalidSegmentId || segment.id > kMaxSegmentId) return FenceError::InvalidGeometry;
    if (segment.path.size() < 2) return FenceError::InvalidGeometry;
    for (const Point2& p : segment.path) {
        if (!geometry::isFinitePoint(p)) return FenceError::InvalidGeometry;
        if (std::fabs(p.x) > kMaxCoordinate || std::fabs(p.y) > kMaxCoordinate) return FenceError::InvalidGeometry;
    }
    return FenceError::Ok;
}

FenceError SegmentStore::create(std::vector<Point2> path, const std::string& styleId, const std::string& colorId,
                                bool isGate, SegmentId& outId) {
    outId = kInvalidSegmentId;
    if (nextId_ > kMaxSegmentId) {
        FENCE_LOG_ERROR("segment store: id space exhausted");
        return FenceError::InvalidOperation;
    }
    Segment seg{};
    seg.id = nextId_;
    seg.path = std::move(path);
    seg.styleId = styleId;
    seg.colorId = colorId;
    seg.isGate = isGate;
    const FenceError err = insert(std::move(seg));
    if (err != FenceError::Ok) return err;
    outId = segments_.back().id;
    return FenceError::Ok;
}

FenceError SegmentStore::insert(Segment segment) {
    const FenceError err = validate(segment);
    if (err != FenceError::Ok) {
        FENCE_LOG_WARN("segment store: rejected segment %u (%s)", segment.id, toString(err));
        return err;
    }
    if (contains(segment.id)) {
        FENCE_LOG_WARN("segment store: duplicate id %u", segment.id);
        return FenceError::DuplicateId;
    }
    segment.length = lengthOf(segment.path);
    noteId(segment.id);
    index_.emplace(segment.id, segments_.size());
    segments_.push_back(std::move(segment));
    touch();
    return FenceError::Ok;
}

std::size_t SegmentStore::removeMany(const std::vector<SegmentId>& ids) {
    if (ids.empty()) return 0;
    const std::unordered_set<SegmentId> doomed(ids.begin(), ids.end());
    const std::size_t before = segments_.size();
    segments_.erase(
        std::remove_if(segments_.begin(), segments_.end(),
            [&](const Segment& s) { return doomed.find(s.id) != doomed.end(); }),
        segments_.end());
    const std::size_t removed = before - segments_.size();
    if (removed > 0) {
        rebuildIndex();
        touch();
    }
    return removed;
}

FenceError SegmentStore::restyle(SegmentId id, const std::string& styleId, const std::string& colorId) {
    const auto it = index_.find(id);
    if (it == index_.end()) return FenceError::UnknownSegment;
    Segment& seg = segments_[it->second];
    seg.styleId = styleId;
    seg.colorId = colorId;
    touch();
    return FenceError::Ok;
}

FenceError SegmentStore::replaceAll(std::vector<Segment> segments) {
    std::unordered_set<SegmentId> seen;
    seen.reserve(segments.size());
    for (const Segment& s : segments) {
        const FenceError err = validate(s);
        if (err != FenceError::Ok) return err;
        if (!seen.insert(s.id).second) return FenceError::DuplicateId;
    }

    segments_ = std::move(segments);
    for (Segment& s : segments_) {
        s.length = lengthOf(s.path);
        noteId(s.id);
    }
    rebuildIndex();
    touch();
    return FenceError::Ok;
}

const Segment* SegmentStore::get(SegmentId id) const {
    const auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &segments_[it->second];
}

void SegmentStore::setGridSize(float gridSize) {
    if (!(gridSize > 0.0f) || gridSize == gridSize_) return;
    gridSize_ = gridSize;
    for (Segment& s : segments_) s.length = lengthOf(s.path);
    touch();
}

double SegmentStore::totalLengthFt() const {
    double total = 0.0;
    for (const Segment& s : segments_) total += s.length;
    return total;
}

std::size_t SegmentStore::gateCount() const {
    return static_cast<std::size_t>(std::count_if(segments_.begin(), segments_.end(),
        [](const Segment& s) { return s.isGate; }));
}

void SegmentStore::rebuildIndex() {
    index_.clear();
    index_.reserve(segments_.size());
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        index_.emplace(segments_[i].id, i);
    }
}

} // namespace fence
