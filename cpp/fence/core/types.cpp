#include "fence/core/types.h"

namespace fence {

const char* toString(FenceError err) noexcept {
    switch (err) {
        case FenceError::Ok: return "ok";
        case FenceError::InvalidMagic: return "invalid magic";
        case FenceError::UnsupportedVersion: return "unsupported version";
        case FenceError::BufferTruncated: return "buffer truncated";
        case FenceError::InvalidPayloadSize: return "invalid payload size";
        case FenceError::ChecksumMismatch: return "checksum mismatch";
        case FenceError::InvalidEncoding: return "invalid encoding";
        case FenceError::InvalidGeometry: return "invalid geometry";
        case FenceError::DuplicateId: return "duplicate id";
        case FenceError::UnknownSegment: return "unknown segment";
        case FenceError::InvalidOperation: return "invalid operation";
        case FenceError::InvalidConfig: return "invalid config";
        case FenceError::EstimatorUnavailable: return "estimator unavailable";
    }
    return "unknown";
}

} // namespace fence
