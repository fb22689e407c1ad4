#include "fence/persistence/share_codec.h"
#include "fence/core/logging.h"
#include "fence/core/util.h"
#include "fence/persistence/base64.h"
#include "fence/persistence/share_internal.h"
#include "fence/scene/segment_store.h"

#include <unordered_map>
#include <unordered_set>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};

class StringTable {
public:
    std::uint32_t intern(const std::string& s) {
        const auto it = index_.find(s);
        if (it != index_.end()) return it->second;
        const auto id = static_cast<std::uint32_t>(strings_.size());
        strings_.push_back(s);
        index_.emplace(s, id);
        return id;
    }
    const std::vector<std::string>& strings() const { return strings_; }

private:
    std::vector<std::string> strings_;
    std::unordered_map<std::string, std::uint32_t> index_;
};
} // namespace

namespace fence {
using namespace share::detail;

std::vector<std::uint8_t> buildShareBytes(const ShareDocument& doc) {
    StringTable strings;
    std::vector<std::uint8_t> segs;
    std::vector<std::uint8_t> pnts;
    std::vector<std::uint8_t> styl;

    std::uint32_t pointCount = 0;
    for (const Segment& s : doc.segments) pointCount += static_cast<std::uint32_t>(s.path.size());

    appendU32(segs, static_cast<std::uint32_t>(doc.segments.size()));
    appendU32(pnts, pointCount);
    std::uint32_t pointOffset = 0;
    for (const Segment& s : doc.segments) {
        appendU32(segs, s.id);
        appendU32(segs, s.isGate ? kSegmentFlagGate : 0u);
        appendU32(segs, strings.intern(s.styleId));
        appendU32(segs, strings.intern(s.colorId));
        appendU32(segs, pointOffset);
        appendU32(segs, static_cast<std::uint32_t>(s.path.size()));
        for (const Point2& p : s.path) {
            appendF32(pnts, p.x);
            appendF32(pnts, p.y);
        }
        pointOffset += static_cast<std::uint32_t>(s.path.size());
    }

    appendU32(styl, strings.intern(doc.styleId));
    appendU32(styl, strings.intern(doc.colorId));

    std::vector<std::uint8_t> strs;
    appendU32(strs, static_cast<std::uint32_t>(strings.strings().size()));
    for (const std::string& s : strings.strings()) {
        appendU32(strs, static_cast<std::uint32_t>(s.size()));
        strs.insert(strs.end(), s.begin(), s.end());
    }

    struct Pending { std::uint32_t tag; const std::vector<std::uint8_t>* payload; };
    const Pending sections[] = {
        {TAG_STRS, &strs},
        {TAG_SEGS, &segs},
        {TAG_PNTS, &pnts},
        {TAG_STYL, &styl},
    };
    const auto sectionCount = static_cast<std::uint32_t>(sizeof(sections) / sizeof(sections[0]));

    std::vector<std::uint8_t> out;
    appendU32(out, shareMagicFshr);
    appendU32(out, shareVersion);
    appendU32(out, sectionCount);
    appendU32(out, 0); // reserved

    std::uint32_t offset = static_cast<std::uint32_t>(shareHeaderBytes + sectionCount * shareSectionEntryBytes);
    for (const Pending& sec : sections) {
        const auto size = static_cast<std::uint32_t>(sec.payload->size());
        appendU32(out, sec.tag);
        appendU32(out, offset);
        appendU32(out, size);
        appendU32(out, crc32(sec.payload->data(), sec.payload->size()));
        offset += size;
    }
    for (const Pending& sec : sections) {
        out.insert(out.end(), sec.payload->begin(), sec.payload->end());
    }
    return out;
}

FenceError parseShareBytes(const std::uint8_t* src, std::size_t byteCount, ShareDocument& out) {
    if (!src || byteCount < shareHeaderBytes) {
        return FenceError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != shareMagicFshr) return FenceError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != shareVersion) return FenceError::UnsupportedVersion;

    const std::uint32_t sectionCount = readU32(src, 8);
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), shareSectionEntryBytes, tableBytes)) {
        return FenceError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(shareHeaderBytes, tableBytes, headerPlusTable)) {
        return FenceError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return FenceError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = shareHeaderBytes + i * shareSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return FenceError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return FenceError::InvalidPayloadSize;
        if (end > byteCount) return FenceError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) return FenceError::ChecksumMismatch;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* strs = findSection(TAG_STRS);
    const SectionView* segs = findSection(TAG_SEGS);
    const SectionView* pnts = findSection(TAG_PNTS);
    const SectionView* styl = findSection(TAG_STYL);
    if (!strs || !segs || !pnts || !styl) {
        return FenceError::InvalidPayloadSize;
    }

    ShareDocument doc{};

    // STRS
    std::vector<std::string> strings;
    {
        std::size_t o = 0;
        if (!requireBytes(o, 4, strs->size)) return FenceError::BufferTruncated;
        const std::uint32_t count = readU32(strs->data, o); o += 4;
        for (std::uint32_t i = 0; i < count; ++i) {
            if (!requireBytes(o, 4, strs->size)) return FenceError::BufferTruncated;
            const std::uint32_t len = readU32(strs->data, o); o += 4;
            if (len > kMaxStringBytes) return FenceError::InvalidPayloadSize;
            if (!requireBytes(o, len, strs->size)) return FenceError::BufferTruncated;
            strings.emplace_back(reinterpret_cast<const char*>(strs->data + o), len);
            o += len;
        }
    }
    const auto lookup = [&](std::uint32_t index, std::string& dst) {
        if (index >= strings.size()) return false;
        dst = strings[index];
        return true;
    };

    // PNTS
    std::vector<Point2> points;
    {
        std::size_t o = 0;
        if (!requireBytes(o, 4, pnts->size)) return FenceError::BufferTruncated;
        const std::uint32_t count = readU32(pnts->data, o); o += 4;
        std::size_t bytes = 0;
        if (!tryMul(count, pointRecordBytes, bytes)) return FenceError::InvalidPayloadSize;
        if (!requireBytes(o, bytes, pnts->size)) return FenceError::BufferTruncated;
        points.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            Point2 p{};
            p.x = readF32(pnts->data, o); o += 4;
            p.y = readF32(pnts->data, o); o += 4;
            points.push_back(p);
        }
    }

    // SEGS
    {
        std::size_t o = 0;
        if (!requireBytes(o, 4, segs->size)) return FenceError::BufferTruncated;
        const std::uint32_t count = readU32(segs->data, o); o += 4;
        std::unordered_set<SegmentId> ids;
        for (std::uint32_t i = 0; i < count; ++i) {
            if (!requireBytes(o, segmentRecordBytes, segs->size)) return FenceError::BufferTruncated;
            Segment seg{};
            seg.id = readU32(segs->data, o); o += 4;
            const std::uint32_t flags = readU32(segs->data, o); o += 4;
            const std::uint32_t styleIndex = readU32(segs->data, o); o += 4;
            const std::uint32_t colorIndex = readU32(segs->data, o); o += 4;
            const std::uint32_t pointOffset = readU32(segs->data, o); o += 4;
            const std::uint32_t pointCount = readU32(segs->data, o); o += 4;

            seg.isGate = (flags & kSegmentFlagGate) != 0;
            if (!lookup(styleIndex, seg.styleId) || !lookup(colorIndex, seg.colorId)) {
                return FenceError::InvalidPayloadSize;
            }
            std::size_t end = 0;
            if (!tryAdd(pointOffset, pointCount, end) || end > points.size()) {
                return FenceError::InvalidPayloadSize;
            }
            seg.path.assign(points.begin() + static_cast<std::ptrdiff_t>(pointOffset), points.begin() + static_cast<std::ptrdiff_t>(end));

            if (seg.id > kMaxSharedSegmentId) return FenceError::InvalidGeometry;
            const FenceError err = SegmentStore::validate(seg);
            if (err != FenceError::Ok) return err;
            if (!ids.insert(seg.id).second) return FenceError::DuplicateId;
            doc.segments.push_back(std::move(seg));
        }
    }

    // STYL
    {
        if (!requireBytes(0, 8, styl->size)) return FenceError::BufferTruncated;
        if (!lookup(readU32(styl->data, 0), doc.styleId) || !lookup(readU32(styl->data, 4), doc.colorId)) {
            return FenceError::InvalidPayloadSize;
        }
    }

    out = std::move(doc);
    return FenceError::Ok;
}

std::string encodeShareToken(const ShareDocument& doc) {
    const std::vector<std::uint8_t> bytes = buildShareBytes(doc);
    return base64UrlEncode(bytes.data(), bytes.size());
}

FenceError decodeShareToken(const std::string& token, ShareDocument& out) {
    std::vector<std::uint8_t> bytes;
    if (!base64Decode(token, bytes)) {
        FENCE_LOG_WARN("share: token is not valid base64");
        return FenceError::InvalidEncoding;
    }
    const FenceError err = parseShareBytes(bytes.data(), bytes.size(), out);
    if (err != FenceError::Ok) {
        FENCE_LOG_WARN("share: rejected token (%s)", toString(err));
    }
    return err;
}

} // namespace fence
