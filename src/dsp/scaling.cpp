#include "csi/dsp/scaling.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <numbers>
#include <liquid/liquid.h>

namespace csi::dsp {

namespace {

constexpr double kPi = std::numbers::pi;

// Phases of the 3x3 mappings, in radians.
constexpr std::array<double, 9> kSm3Ht20{
    -2 * kPi / 16,         -2 * kPi / (80.0 / 33), 2 * kPi / (80.0 / 3),
     2 * kPi / (80.0 / 23), 2 * kPi / (48.0 / 13), 2 * kPi / (240.0 / 13),
    -2 * kPi / (80.0 / 13), 2 * kPi / (240.0 / 37), 2 * kPi / (48.0 / 13)};

constexpr std::array<double, 9> kSm3Ht40{
    -2 * kPi / 16,          -2 * kPi / (80.0 / 13), 2 * kPi / (80.0 / 23),
    -2 * kPi / (80.0 / 37), -2 * kPi / (48.0 / 11), -2 * kPi / (240.0 / 107),
     2 * kPi / (80.0 / 7),  -2 * kPi / (240.0 / 83), -2 * kPi / (48.0 / 11)};

liquid_double_complex* as_liquid(cdouble* p) { return reinterpret_cast<liquid_double_complex*>(p); }

std::vector<cdouble> inverted(unsigned ntx, bool ht40) {
    auto m = spatial_mapping(ntx, ht40);
    matrixc_inv(as_liquid(m.data()), ntx, ntx);
    return m;
}

// inv(SM) for {2x2 HT20, 2x2 HT40, 3x3 HT20, 3x3 HT40}.
const std::vector<cdouble>& inverse_mapping(unsigned ntx, bool ht40) {
    static const std::array<std::vector<cdouble>, 4> cache{
        inverted(2, false), inverted(2, true), inverted(3, false), inverted(3, true)};
    return cache[(ntx - 2) * 2 + (ht40 ? 1 : 0)];
}

void scale_rows(const rx::IntelRecords& r, Column<cdouble>& csi) {
    for (std::size_t i = 0; i < r.size(); ++i) {
        auto row = csi.row(i);
        double csi_pwr = 0;
        for (const auto& v : row) csi_pwr += std::norm(v);
        if (csi_pwr == 0) {
            std::fill(row.begin(), row.end(), cdouble{});
            continue;
        }
        const unsigned nrx = r.nrx[i];
        const unsigned ntx = r.ntx[i];
        const double rssi_pwr = std::pow(10.0, total_rss(r.rssi_a[i], r.rssi_b[i], r.rssi_c[i], r.agc[i]) / 10);
        const double scale = rssi_pwr / (csi_pwr / rx::INTEL_SUBCARRIERS);

        const double noise_db = r.noise[i] == -127 ? -92.0 : double(r.noise[i]);
        const double thermal = std::pow(10.0, noise_db / 10);
        const double quant = scale * nrx * ntx;
        double k = std::sqrt(scale / (thermal + quant));
        if (ntx == 2)
            k *= std::sqrt(2.0);
        else if (ntx == 3)
            k *= std::sqrt(std::pow(10.0, 4.5 / 10));
        for (auto& v : row) v *= k;
    }
}

} // namespace

double total_rss(uint8_t rssi_a, uint8_t rssi_b, uint8_t rssi_c, uint8_t agc) {
    double mag = 0;
    for (uint8_t v : {rssi_a, rssi_b, rssi_c})
        if (v != 0) mag += std::pow(10.0, v / 10.0);
    return 10 * std::log10(mag) - 44 - agc;
}

std::vector<double> get_total_rss(const rx::IntelRecords& r) {
    std::vector<double> out(r.size());
    for (std::size_t i = 0; i < out.size(); ++i)
        out[i] = total_rss(r.rssi_a[i], r.rssi_b[i], r.rssi_c[i], r.agc[i]);
    return out;
}

std::vector<cdouble> spatial_mapping(unsigned ntx, bool ht40) {
    using namespace std::complex_literals;
    if (ntx == 2) {
        const double s = 1 / std::sqrt(2.0);
        if (ht40) return {s, 1i * s, 1i * s, s};
        return {s, s, s, -s};
    }
    if (ntx == 3) {
        const auto& ph = ht40 ? kSm3Ht40 : kSm3Ht20;
        std::vector<cdouble> m(9);
        for (std::size_t k = 0; k < 9; ++k) m[k] = std::polar(1 / std::sqrt(3.0), ph[k]);
        return m;
    }
    return {1.0};
}

void apply_sm_inplace(const rx::IntelRecords& r, Column<cdouble>& csi) {
    std::vector<cdouble> h, z;
    for (std::size_t i = 0; i < r.size(); ++i) {
        const unsigned nrx = r.nrx[i];
        const unsigned ntx = r.ntx[i];
        if (ntx < 2 || ntx > 3 || nrx == 0) continue;
        const bool ht40 = (r.rate[i] & RATE_HT40_FLAG) != 0;
        auto inv = inverse_mapping(ntx, ht40);

        h.resize(nrx * ntx);
        z.resize(nrx * ntx);
        auto row = csi.row(i);
        for (std::size_t sc = 0; sc < rx::INTEL_SUBCARRIERS; ++sc) {
            for (unsigned a = 0; a < nrx; ++a)
                for (unsigned t = 0; t < ntx; ++t) h[a * ntx + t] = row[r.csi_index(sc, a, t)];
            matrixc_mul(as_liquid(h.data()), nrx, ntx,
                        as_liquid(inv.data()), ntx, ntx,
                        as_liquid(z.data()), nrx, ntx);
            for (unsigned a = 0; a < nrx; ++a)
                for (unsigned t = 0; t < ntx; ++t) row[r.csi_index(sc, a, t)] = z[a * ntx + t];
        }
    }
}

Column<cdouble> apply_sm(const rx::IntelRecords& r, const Column<cdouble>& csi) {
    Column<cdouble> out = csi;
    apply_sm_inplace(r, out);
    return out;
}

Column<cdouble> get_scaled_csi(const rx::IntelRecords& r) {
    Column<cdouble> out = r.csi;
    scale_rows(r, out);
    return out;
}

void get_scaled_csi_inplace(rx::IntelRecords& r) { scale_rows(r, r.csi); }

Column<cdouble> get_scaled_csi_sm(const rx::IntelRecords& r) {
    Column<cdouble> out = get_scaled_csi(r);
    apply_sm_inplace(r, out);
    return out;
}

void get_scaled_csi_sm_inplace(rx::IntelRecords& r) {
    scale_rows(r, r.csi);
    apply_sm_inplace(r, r.csi);
}

} // namespace csi::dsp
