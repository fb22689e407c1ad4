#ifndef FENCE_CORE_UTIL_H
#define FENCE_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void appendU32(std::vector<std::uint8_t>& dst, std::uint32_t v) {
    const std::size_t at = dst.size();
    dst.resize(at + sizeof(v));
    std::memcpy(dst.data() + at, &v, sizeof(v));
}

static inline void appendF32(std::vector<std::uint8_t>& dst, float v) {
    const std::size_t at = dst.size();
    dst.resize(at + sizeof(v));
    std::memcpy(dst.data() + at, &v, sizeof(v));
}

#endif // FENCE_CORE_UTIL_H
