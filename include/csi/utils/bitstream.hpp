#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include "csi/utils/endian.hpp"

namespace csi::utils {

// Reads fixed-point fields of 1..32 bits, LSB-first, from a byte span.
// The bit stream is formed from `word_bytes`-wide words laid out in
// `order`: Intel packs plain bytes (word_bytes = 1), Atheros packs 16-bit
// words whose byte order follows the capture.
class BitCursor {
public:
    explicit BitCursor(std::span<const uint8_t> bytes,
                       ByteOrder order = ByteOrder::Little,
                       unsigned word_bytes = 1,
                       std::size_t bit_offset = 0);

    // nullopt when fewer than `width` bits remain; the cursor is not moved.
    std::optional<uint32_t> read_unsigned(unsigned width);
    std::optional<int32_t> read_signed(unsigned width);

    bool skip(std::size_t bits);

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return total_bits_ - pos_; }

private:
    unsigned bit_at(std::size_t p) const;

    std::span<const uint8_t> bytes_;
    ByteOrder order_;
    unsigned word_bytes_;
    std::size_t total_bits_;
    std::size_t pos_;
};

// Two's-complement sign extension of the low `width` bits of `v`.
inline int32_t sign_extend(uint32_t v, unsigned width) {
    if (width >= 32) return static_cast<int32_t>(v);
    const uint32_t m = 1u << (width - 1);
    v &= (1u << width) - 1u;
    return static_cast<int32_t>((v ^ m)) - static_cast<int32_t>(m);
}

} // namespace csi::utils
