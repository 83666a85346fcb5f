#include "csi/utils/nexmon_float.hpp"

#include <vector>

namespace csi::utils {

void unpack_float_acphy(std::span<const uint32_t> words, std::span<int32_t> out,
                        const PackedFloatFormat& fmt) {
    const int nman = fmt.nman;
    const int nexp = fmt.nexp;
    const uint32_t iq_mask = (1u << (nman - 1)) - 1;
    const uint32_t e_mask = (1u << nexp) - 1;
    const int e_p = 1 << (nexp - 1);
    const uint32_t sgnr_mask = 1u << (nexp + 2 * nman - 1);
    const uint32_t sgni_mask = sgnr_mask >> nman;
    const int e_zero = -nman;

    std::vector<int> exps(words.size());
    std::vector<uint32_t> mags(out.size());
    std::vector<bool> neg(out.size());
    int maxbit = -e_p;

    for (std::size_t i = 0; i < words.size(); ++i) {
        const uint32_t h = words[i];
        const uint32_t vi = (h >> (nexp + nman)) & iq_mask;
        const uint32_t vq = (h >> nexp) & iq_mask;
        int e = int(h & e_mask);
        if (e >= e_p) e -= e_p << 1;
        exps[i] = e;

        uint32_t x = vi | vq;
        if (fmt.autoscale && x) {
            // e + position of the highest set bit of x
            uint32_t m = 0xffff0000u, b = 0xffffu;
            int s = 16;
            while (s > 0) {
                if (x & m) {
                    e += s;
                    x >>= s;
                }
                s >>= 1;
                m = (m >> s) & b;
                b >>= s;
            }
            if (e > maxbit) maxbit = e;
        }
        mags[2 * i] = vi;
        mags[2 * i + 1] = vq;
        neg[2 * i] = (h & sgnr_mask) != 0;
        neg[2 * i + 1] = (h & sgni_mask) != 0;
    }

    const int shft = fmt.autoscale ? fmt.nbits - maxbit : 0;
    for (std::size_t k = 0; k < out.size(); ++k) {
        int e = exps[k >> 1] + shft;
        int32_t v = static_cast<int32_t>(mags[k]);
        // Zero words carry no bit position and may hold any exponent.
        if (v == 0 || e < e_zero || e >= 32) {
            v = 0;
        } else if (e < 0) {
            v >>= -e;
        } else {
            v <<= e;
        }
        out[k] = neg[k] ? -v : v;
    }
}

} // namespace csi::utils
