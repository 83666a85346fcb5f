#include <gtest/gtest.h>
#include "csi/csi.hpp"
#include "capture_writer.hpp"
#include <cmath>
#include <vector>
using namespace csi;
using namespace csi_test;

namespace {

Intel realtime(const std::vector<IntelBfee>& recs, rx::IntelParams p = {}) {
    Intel s(std::nullopt, rx::IntelFormat(p), rx::SessionOptions{false, recs.size()});
    for (const auto& r : recs) s.pmsg(intel_record(r));
    return s;
}

// Sets every subcarrier of `rec` to the same nrx x ntx matrix.
void fill_matrix(IntelBfee& rec, const std::vector<icplx>& m) {
    rec.csi.clear();
    for (unsigned sc = 0; sc < rx::INTEL_SUBCARRIERS; ++sc) rec.csi.insert(rec.csi.end(), m.begin(), m.end());
}

} // namespace

TEST(IntelScaling, TotalRssSumsActiveChains) {
    const double expected = 10 * std::log10(std::pow(10, 4.0) + std::pow(10, 3.8) + std::pow(10, 3.6)) - 44 - 30;
    EXPECT_NEAR(dsp::total_rss(40, 38, 36, 30), expected, 1e-9);
    EXPECT_NEAR(dsp::total_rss(40, 0, 0, 30), 40 - 44 - 30, 1e-9);
}

TEST(IntelScaling, TotalRssPerRecord) {
    IntelBfee a = intel_sample(1);
    IntelBfee b = intel_sample(2);
    b.rssi_b = 0;
    b.rssi_c = 0;
    b.agc = 20;
    auto s = realtime({a, b});
    const auto rss = dsp::get_total_rss(s.records());
    ASSERT_EQ(rss.size(), 2u);
    EXPECT_NEAR(rss[0], dsp::total_rss(40, 38, 36, 30), 1e-12);
    EXPECT_NEAR(rss[1], 40 - 44 - 20, 1e-12);
}

TEST(IntelScaling, MatchesCalibrationFormula) {
    IntelBfee rec = intel_sample(1);
    rec.noise = -127;
    auto s = realtime({rec});
    const auto& r = s.records();

    double csi_pwr = 0;
    for (const auto& v : rec.csi) csi_pwr += double(v.real()) * v.real() + double(v.imag()) * v.imag();
    const double rssi_pwr = std::pow(10.0, dsp::total_rss(40, 38, 36, 30) / 10);
    const double scale = rssi_pwr / (csi_pwr / 30);
    const double total_noise = std::pow(10.0, -92.0 / 10) + scale * 3 * 2;
    const double k = std::sqrt(scale / total_noise) * std::sqrt(2.0);

    const auto scaled = dsp::get_scaled_csi(r);
    for (std::size_t i = 0; i < scaled.data().size(); ++i) {
        const cdouble want = r.csi.data()[i] * k;
        EXPECT_NEAR(scaled.data()[i].real(), want.real(), 1e-12);
        EXPECT_NEAR(scaled.data()[i].imag(), want.imag(), 1e-12);
    }
}

TEST(IntelScaling, ThreeTransmitGain) {
    IntelBfee rec = intel_sample(1, 1, 3);
    auto s = realtime({rec}, rx::IntelParams{1, 3, 0});
    const auto& r = s.records();
    double csi_pwr = 0;
    for (const auto& v : r.csi.data()) csi_pwr += std::norm(v);
    const double scale = std::pow(10.0, dsp::total_rss(40, 38, 36, 30) / 10) / (csi_pwr / 30);
    const double k = std::sqrt(scale / (std::pow(10.0, -9.2) + scale * 3)) * std::sqrt(std::pow(10.0, 0.45));
    const auto scaled = dsp::get_scaled_csi(r);
    EXPECT_NEAR(std::abs(scaled.data()[5]), std::abs(r.csi.data()[5]) * k, 1e-12);
}

TEST(IntelScaling, ZeroPowerScalesToZero) {
    IntelBfee rec = intel_sample(1);
    fill_matrix(rec, std::vector<icplx>(6, icplx(0, 0)));
    auto s = realtime({rec});
    const auto scaled = dsp::get_scaled_csi(s.records());
    for (const auto& v : scaled.data()) {
        EXPECT_EQ(v, cdouble{});
    }
}

TEST(IntelScaling, InPlaceMatchesCopy) {
    auto s = realtime({intel_sample(1), intel_sample(2, 2, 1), intel_sample(3)});
    const auto copied = dsp::get_scaled_csi(s.records());
    const auto raw = s.records().csi.data();

    dsp::get_scaled_csi_inplace(s.records());
    EXPECT_EQ(s.records().csi.data(), copied.data());
    EXPECT_NE(s.records().csi.data(), raw);
}

TEST(IntelScaling, ScaledSmInPlaceMatchesCopy) {
    IntelBfee ht40 = intel_sample(2);
    ht40.rate |= dsp::RATE_HT40_FLAG;
    auto s = realtime({intel_sample(1), ht40, intel_sample(3, 3, 3)}, rx::IntelParams{3, 3, 0});
    const auto copied = dsp::get_scaled_csi_sm(s.records());
    const auto staged = dsp::apply_sm(s.records(), dsp::get_scaled_csi(s.records()));
    EXPECT_EQ(copied.data(), staged.data());

    dsp::get_scaled_csi_sm_inplace(s.records());
    EXPECT_EQ(s.records().csi.data(), copied.data());
}

TEST(SpatialMapping, MatricesAreUnitary) {
    for (unsigned ntx : {2u, 3u})
        for (bool ht40 : {false, true}) {
            const auto m = dsp::spatial_mapping(ntx, ht40);
            ASSERT_EQ(m.size(), ntx * ntx);
            for (unsigned i = 0; i < ntx; ++i)
                for (unsigned j = 0; j < ntx; ++j) {
                    cdouble acc{};
                    for (unsigned k = 0; k < ntx; ++k) acc += m[i * ntx + k] * std::conj(m[j * ntx + k]);
                    EXPECT_NEAR(acc.real(), i == j ? 1.0 : 0.0, 1e-12);
                    EXPECT_NEAR(acc.imag(), 0.0, 1e-12);
                }
        }
}

TEST(SpatialMapping, UndoesTwoByTwoHt20) {
    // H = sqrt(2) * SM, so H * inv(SM) = sqrt(2) * I.
    IntelBfee rec = intel_sample(1, 2, 2);
    fill_matrix(rec, {icplx(1, 0), icplx(1, 0), icplx(1, 0), icplx(-1, 0)});
    auto s = realtime({rec}, rx::IntelParams{2, 2, 0});
    const auto& r = s.records();
    const auto out = dsp::apply_sm(r, r.csi);
    for (unsigned sc = 0; sc < rx::INTEL_SUBCARRIERS; ++sc)
        for (unsigned a = 0; a < 2; ++a)
            for (unsigned t = 0; t < 2; ++t) {
                const cdouble v = out.row(0)[r.csi_index(sc, a, t)];
                EXPECT_NEAR(v.real(), a == t ? std::sqrt(2.0) : 0.0, 1e-12);
                EXPECT_NEAR(v.imag(), 0.0, 1e-12);
            }
}

TEST(SpatialMapping, UndoesTwoByTwoHt40) {
    IntelBfee rec = intel_sample(1, 2, 2);
    rec.rate = 0x0900;
    fill_matrix(rec, {icplx(1, 0), icplx(0, 1), icplx(0, 1), icplx(1, 0)});
    auto s = realtime({rec}, rx::IntelParams{2, 2, 0});
    const auto& r = s.records();
    const auto out = dsp::apply_sm(r, r.csi);
    for (unsigned a = 0; a < 2; ++a)
        for (unsigned t = 0; t < 2; ++t) {
            const cdouble v = out.row(0)[r.csi_index(7, a, t)];
            EXPECT_NEAR(v.real(), a == t ? std::sqrt(2.0) : 0.0, 1e-12);
            EXPECT_NEAR(v.imag(), 0.0, 1e-12);
        }
}

TEST(SpatialMapping, ThreeByThreeRoundTripsThroughMapping) {
    for (uint16_t rate : {uint16_t(0x0101), uint16_t(0x0901)}) {
        IntelBfee rec = intel_sample(1, 3, 3);
        rec.rate = rate;
        auto s = realtime({rec}, rx::IntelParams{3, 3, 0});
        const auto& r = s.records();
        const auto out = dsp::apply_sm(r, r.csi);
        const auto sm = dsp::spatial_mapping(3, (rate & dsp::RATE_HT40_FLAG) != 0);
        for (unsigned sc = 0; sc < rx::INTEL_SUBCARRIERS; ++sc)
            for (unsigned a = 0; a < 3; ++a)
                for (unsigned t = 0; t < 3; ++t) {
                    cdouble back{};
                    for (unsigned k = 0; k < 3; ++k) back += out.row(0)[r.csi_index(sc, a, k)] * sm[k * 3 + t];
                    const cdouble orig = r.csi.row(0)[r.csi_index(sc, a, t)];
                    EXPECT_NEAR(back.real(), orig.real(), 1e-9);
                    EXPECT_NEAR(back.imag(), orig.imag(), 1e-9);
                }
    }
}

TEST(SpatialMapping, SingleTransmitUnchanged) {
    auto s = realtime({intel_sample(1, 3, 1)}, rx::IntelParams{3, 1, 0});
    const auto out = dsp::apply_sm(s.records(), s.records().csi);
    EXPECT_EQ(out.data(), s.records().csi.data());
}
