#ifndef FENCE_CORE_TYPES_H
#define FENCE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by every engine module.

namespace fence {

using SegmentId = std::uint32_t;
static constexpr SegmentId kInvalidSegmentId = 0;
// Highest id the store accepts, so nextId never wraps back to 0.
static constexpr SegmentId kMaxSegmentId = 0xFFFFFFFEu;
// Highest id a share token may carry; leaves room for local allocation.
static constexpr SegmentId kMaxSharedSegmentId = 0x00FFFFFFu;

// Drawing defaults (pixels per foot, pixel tolerances).
static constexpr float kDefaultGridSize = 20.0f;
static constexpr float kDefaultSnapTolerancePx = 10.0f;
static constexpr std::size_t kDefaultHistoryLimit = 50;
static constexpr double kDefaultDebounceMs = 500.0;
static constexpr std::size_t kMaxHistoryLimit = 50;

// Stored coordinates must lie within +/- kMaxCoordinate pixels.
static constexpr float kMaxCoordinate = 1.0e6f;
static constexpr double kMaxPrecisionLengthFt = 10000.0;

// Share token format constants
static constexpr std::uint32_t shareMagicFshr = 0x52485346; // "FSHR"
static constexpr std::uint32_t shareVersion = 1;
static constexpr std::size_t shareHeaderBytes = 4 * 4; // magic + version + sectionCount + reserved
static constexpr std::size_t shareSectionEntryBytes = 4 * 4; // tag + offset + size + crc32
static constexpr std::size_t segmentRecordBytes = 6 * 4; // id + flags + style + color + pointOffset + pointCount
static constexpr std::size_t pointRecordBytes = 8;

struct Point2 { float x; float y; };

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

struct Bounds2 {
    float minX, minY, maxX, maxY;
    bool valid;
};

enum class FenceError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    ChecksumMismatch = 5,
    InvalidEncoding = 6,
    InvalidGeometry = 7,
    DuplicateId = 8,
    UnknownSegment = 9,
    InvalidOperation = 10,
    InvalidConfig = 11,
    EstimatorUnavailable = 12,
};

const char* toString(FenceError err) noexcept;

} // namespace fence

#endif // FENCE_CORE_TYPES_H
