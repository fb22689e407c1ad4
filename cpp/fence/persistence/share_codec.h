#pragma once

#include "fence/core/types.h"
#include "fence/scene/segment.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fence {

// Everything a share link carries: the drawing plus the active style/color.
struct ShareDocument {
    std::vector<Segment> segments;
    std::string styleId;
    std::string colorId;
};

// Sectioned little-endian blob: header, section table (tag, offset, size,
// crc32), then STRS / SEGS / PNTS / STYL payloads.
std::vector<std::uint8_t> buildShareBytes(const ShareDocument& doc);
// Fills `out` only on success. Lengths are left at 0 for the store to derive.
FenceError parseShareBytes(const std::uint8_t* src, std::size_t byteCount, ShareDocument& out);

std::string encodeShareToken(const ShareDocument& doc);
FenceError decodeShareToken(const std::string& token, ShareDocument& out);

} // namespace fence
