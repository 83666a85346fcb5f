#include "csi/utils/bitstream.hpp"

namespace csi::utils {

BitCursor::BitCursor(std::span<const uint8_t> bytes, ByteOrder order,
                     unsigned word_bytes, std::size_t bit_offset)
    : bytes_(bytes), order_(order), word_bytes_(word_bytes ? word_bytes : 1) {
    // A trailing partial word cannot be addressed in a word-swapped stream.
    const std::size_t usable = bytes_.size() - bytes_.size() % word_bytes_;
    total_bits_ = usable * 8;
    pos_ = bit_offset < total_bits_ ? bit_offset : total_bits_;
}

unsigned BitCursor::bit_at(std::size_t p) const {
    const std::size_t word_bits = std::size_t(word_bytes_) * 8;
    const std::size_t word = p / word_bits;
    const std::size_t in_word = p % word_bits;
    std::size_t byte = in_word / 8;
    if (order_ == ByteOrder::Big) byte = word_bytes_ - 1 - byte;
    return (bytes_[word * word_bytes_ + byte] >> (in_word % 8)) & 1u;
}

std::optional<uint32_t> BitCursor::read_unsigned(unsigned width) {
    if (width == 0 || width > 32 || remaining() < width) return std::nullopt;
    uint32_t v = 0;
    for (unsigned i = 0; i < width; ++i)
        v |= uint32_t(bit_at(pos_ + i)) << i;
    pos_ += width;
    return v;
}

std::optional<int32_t> BitCursor::read_signed(unsigned width) {
    auto v = read_unsigned(width);
    if (!v) return std::nullopt;
    return sign_extend(*v, width);
}

bool BitCursor::skip(std::size_t bits) {
    if (remaining() < bits) return false;
    pos_ += bits;
    return true;
}

} // namespace csi::utils
