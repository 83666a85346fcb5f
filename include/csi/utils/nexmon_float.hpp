#pragma once
#include <cstdint>
#include <span>

namespace csi::utils {

// Parameters of the Broadcom ACPHY packed floating-point CSI word:
// [sign_i | mant_i | sign_q | mant_q | exponent], mantissa fields carry
// nman-1 magnitude bits.
struct PackedFloatFormat {
    int nbits{10};
    int nman{12};
    int nexp{6};
    bool autoscale{true};
};

// Expand `words.size()` packed words into interleaved (i, q) integers;
// `out` must hold 2 * words.size() values.
void unpack_float_acphy(std::span<const uint32_t> words, std::span<int32_t> out,
                        const PackedFloatFormat& fmt = {});

} // namespace csi::utils
