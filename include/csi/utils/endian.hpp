#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace csi::utils {

enum class ByteOrder { Little, Big };

// Parse "little"/"big" (the spelling used by the capture tools' docs).
ByteOrder parse_byte_order(const char* name);

inline uint16_t load_u16(const uint8_t* p, ByteOrder o) {
    return o == ByteOrder::Little ? uint16_t(p[0] | (p[1] << 8))
                                  : uint16_t((p[0] << 8) | p[1]);
}

inline uint32_t load_u32(const uint8_t* p, ByteOrder o) {
    if (o == ByteOrder::Little)
        return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline uint64_t load_u64(const uint8_t* p, ByteOrder o) {
    uint64_t lo = load_u32(p, o), hi = load_u32(p + 4, o);
    if (o == ByteOrder::Big) std::swap(lo, hi);
    return lo | (hi << 32);
}

inline uint16_t load_u16_be(const uint8_t* p) { return load_u16(p, ByteOrder::Big); }
inline uint16_t load_u16_le(const uint8_t* p) { return load_u16(p, ByteOrder::Little); }
inline uint32_t load_u32_le(const uint8_t* p) { return load_u32(p, ByteOrder::Little); }

} // namespace csi::utils
