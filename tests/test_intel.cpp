#include <gtest/gtest.h>
#include "csi/csi.hpp"
#include "capture_writer.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>
using namespace csi;
using namespace csi_test;

namespace {

rx::SessionOptions quiet(std::size_t bufsize = 0) { return {false, bufsize}; }

void expect_csi(const rx::IntelRecords& r, std::size_t i, const IntelBfee& src) {
    auto row = r.csi.row(i);
    std::size_t k = 0;
    for (unsigned sc = 0; sc < rx::INTEL_SUBCARRIERS; ++sc)
        for (unsigned a = 0; a < src.nrx; ++a)
            for (unsigned t = 0; t < src.ntx; ++t, ++k) {
                const cdouble got = row[r.csi_index(sc, a, t)];
                ASSERT_EQ(got, cdouble(src.csi[k].real(), src.csi[k].imag())) << "sc " << sc << " rx " << a << " tx " << t;
            }
}

} // namespace

class IntelCapture : public CaptureDir {
protected:
    void SetUp() override {
        CaptureDir::SetUp();
        recs_ = {intel_sample(10), intel_sample(11), intel_sample(14)};
        Bytes file;
        append(file, intel_record(recs_[0]));
        append(file, intel_frame(rx::INTEL_CODE_MAC, mac_frame(0x0208, 321, 0x40)));
        append(file, intel_frame(0x99, Bytes(12, 0x55)));
        append(file, intel_record(recs_[1]));
        append(file, intel_record(recs_[2]));
        path_ = write("log.dat", file);
    }

    std::vector<IntelBfee> recs_;
    std::filesystem::path path_;
};

TEST_F(IntelCapture, ReadDecodesEveryMeasurement) {
    Intel s(path_, rx::IntelFormat{}, quiet());
    EXPECT_EQ(s.read(), 3u);
    ASSERT_EQ(s.count(), 3u);
    const auto& r = s.records();
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(r.timestamp_low[i], recs_[i].timestamp_low);
        EXPECT_EQ(r.bfee_count[i], recs_[i].bfee_count);
        EXPECT_EQ(r.nrx[i], 3);
        EXPECT_EQ(r.ntx[i], 2);
        EXPECT_EQ(r.rssi_a[i], 40);
        EXPECT_EQ(r.rssi_b[i], 38);
        EXPECT_EQ(r.rssi_c[i], 36);
        EXPECT_EQ(r.noise[i], -92);
        EXPECT_EQ(r.agc[i], 30);
        EXPECT_EQ(r.rate[i], 0x0101);
        expect_csi(r, i, recs_[i]);
    }
    EXPECT_EQ(r.offset[0], 0u);
}

TEST_F(IntelCapture, ReportCountsFramesByKind) {
    Intel s(path_, rx::IntelFormat{}, quiet());
    s.read();
    const auto& rep = s.report();
    EXPECT_EQ(rep.appended, 3u);
    EXPECT_EQ(rep.auxiliary, 1u);
    EXPECT_EQ(rep.skipped, 1u);
    EXPECT_EQ(rep.malformed, 0u);
    // 11 -> 14 loses two measurements.
    EXPECT_EQ(rep.dropped, 2u);
    EXPECT_EQ(rep.stop, DecodeStatus::EndOfStream);
}

TEST_F(IntelCapture, MacFrameAttachesToPreviousMeasurement) {
    Intel s(path_, rx::IntelFormat(rx::IntelParams{3, 2, 8}), quiet());
    s.read();
    const auto& r = s.records();
    EXPECT_EQ(r.fc[0], 0x0208);
    EXPECT_EQ(r.dur[0], 44);
    EXPECT_EQ(r.seq[0], 321);
    EXPECT_EQ(r.addr_des.row(0)[0], 0x40);
    EXPECT_EQ(r.addr_src.row(0)[0], 0x50);
    EXPECT_EQ(r.addr_bssid.row(0)[5], 0x65);
    EXPECT_EQ(r.payload.row(0)[0], 0x08);
    EXPECT_EQ(r.payload.row(0).size(), 8u);
    EXPECT_EQ(r.seq[1], 0);
}

TEST_F(IntelCapture, SeekReproducesBatchRecord) {
    Intel all(path_, rx::IntelFormat{}, quiet());
    all.read();
    for (std::size_t k = 0; k < all.count(); ++k) {
        Intel one(std::nullopt, rx::IntelFormat{}, quiet());
        EXPECT_EQ(one.seek(path_, all.records().offset[k], 1), 1u);
        ASSERT_EQ(one.count(), 1u);
        EXPECT_EQ(one.records().bfee_count[0], all.records().bfee_count[k]);
        EXPECT_EQ(one.records().csi.data(), std::vector<cdouble>(all.records().csi.row(k).begin(),
                                                                 all.records().csi.row(k).end()));
    }
}

TEST_F(IntelCapture, SeekAppendsToBuffer) {
    Intel s(path_, rx::IntelFormat{}, quiet());
    s.seek(0, 1);
    s.seek(0, 2);
    ASSERT_EQ(s.count(), 3u);
    EXPECT_EQ(s.records().bfee_count[0], 10);
    EXPECT_EQ(s.records().bfee_count[1], 10);
    EXPECT_EQ(s.records().bfee_count[2], 11);
    EXPECT_EQ(s.report().stop, DecodeStatus::Ok);
}

TEST_F(IntelCapture, OutOfOrderSeeksReportNoDrops) {
    Bytes file;
    for (uint16_t n : {10, 11, 12}) append(file, intel_record(intel_sample(n)));
    const auto p = write("clean.dat", file);
    Intel all(p, rx::IntelFormat{}, quiet());
    all.read();
    ASSERT_EQ(all.count(), 3u);

    Intel s(std::nullopt, rx::IntelFormat{}, quiet());
    s.seek(p, all.records().offset[2], 1);
    EXPECT_EQ(s.report().dropped, 0u);
    s.seek(p, 0, 1);
    EXPECT_EQ(s.records().bfee_count[1], 10);
    EXPECT_EQ(s.report().dropped, 0u);
    // Gaps inside one seek are still counted.
    s.seek(path_, 0, 0);
    EXPECT_EQ(s.report().dropped, 2u);
}

TEST_F(IntelCapture, BoundedReadStopsAtCapacity) {
    Intel s(path_, rx::IntelFormat{}, quiet(2));
    EXPECT_EQ(s.read(), 2u);
    EXPECT_EQ(s.report().stop, DecodeStatus::CapacityReached);
    EXPECT_THROW(s.seek(0, 3), std::invalid_argument);
}

TEST_F(IntelCapture, ReadContinuesFromCursor) {
    Intel s(path_, rx::IntelFormat{}, quiet());
    s.seek(0, 1);
    EXPECT_EQ(s.read(), 2u);
    EXPECT_EQ(s.records().bfee_count[2], 14);
}

TEST_F(IntelCapture, RecordViewAndSlice) {
    Intel s(path_, rx::IntelFormat{}, quiet());
    s.read();
    const auto v = s[1];
    EXPECT_EQ(std::get<int64_t>(v.at("bfee_count")), 11);
    EXPECT_EQ(std::get<uint64_t>(v.at("offset")), s.records().offset[1]);
    EXPECT_EQ(s.slice(1, 10).size(), 2u);
    EXPECT_THROW(s.at(3), std::out_of_range);
}

TEST_F(IntelCapture, TruncatedTailStopsBatch) {
    Bytes file;
    append(file, intel_record(recs_[0]));
    append(file, intel_record(recs_[1]));
    const Bytes last = intel_record(recs_[2]);
    file.insert(file.end(), last.begin(), last.begin() + 40);
    const auto p = write("cut.dat", file);

    Intel s(p, rx::IntelFormat{}, quiet());
    EXPECT_EQ(s.read(), 2u);
    EXPECT_EQ(s.report().stop, DecodeStatus::TruncatedInput);
    // The cut record is retried from its start on the next read.
    EXPECT_EQ(s.position(), intel_record(recs_[0]).size() + intel_record(recs_[1]).size());
}

TEST_F(IntelCapture, ZeroLengthFrameIsSkipped) {
    Bytes file;
    append(file, intel_record(recs_[0]));
    append(file, Bytes{0x00, 0x00, rx::INTEL_CODE_BFEE});
    append(file, intel_record(recs_[1]));
    Intel s(write("zero.dat", file), rx::IntelFormat{}, quiet());
    EXPECT_EQ(s.read(), 2u);
    EXPECT_EQ(s.records().bfee_count[1], 11);
    EXPECT_EQ(s.report().malformed, 1u);
    EXPECT_EQ(s.report().stop, DecodeStatus::EndOfStream);
    EXPECT_EQ(s.records().offset[1], intel_record(recs_[0]).size() + 3);
}

TEST_F(IntelCapture, ShapeMismatchIsSkipped) {
    Bytes file;
    append(file, intel_record(intel_sample(1, 2, 2)));
    append(file, intel_record(intel_sample(2, 3, 2)));
    append(file, intel_record(intel_sample(3, 1, 1)));
    const auto p = write("shape.dat", file);

    Intel s(p, rx::IntelFormat(rx::IntelParams{2, 2, 0}), quiet());
    EXPECT_EQ(s.read(), 2u);
    EXPECT_EQ(s.report().malformed, 1u);
    EXPECT_EQ(s.records().bfee_count[0], 1);
    EXPECT_EQ(s.records().bfee_count[1], 3);
    // 1x1 record inside a 2x2 buffer: unused antennas stay zero.
    EXPECT_EQ(s.records().csi.row(1)[s.records().csi_index(0, 1, 1)], cdouble{});
}

TEST_F(IntelCapture, LengthMismatchIsSkipped) {
    IntelBfee bad = intel_sample(5);
    bad.csi_len_override = 100;
    Bytes file;
    append(file, intel_record(bad));
    append(file, intel_record(intel_sample(6)));
    const auto p = write("len.dat", file);

    Intel s(p, rx::IntelFormat{}, quiet());
    EXPECT_EQ(s.read(), 1u);
    EXPECT_EQ(s.report().malformed, 1u);
    EXPECT_EQ(s.records().bfee_count[0], 6);
}

TEST_F(IntelCapture, PermutationPlacesChainsOnAntennas) {
    IntelBfee rec = intel_sample(1);
    rec.antenna_sel = antenna_sel(2, 0, 1);
    const auto p = write("perm.dat", intel_record(rec));

    Intel s(p, rx::IntelFormat{}, quiet());
    s.read();
    const auto& r = s.records();
    const unsigned perm[3] = {2, 0, 1};
    EXPECT_EQ(r.perm.row(0)[0], 2);
    for (unsigned sc = 0; sc < rx::INTEL_SUBCARRIERS; ++sc)
        for (unsigned chain = 0; chain < 3; ++chain)
            for (unsigned t = 0; t < 2; ++t) {
                const icplx raw = rec.csi[(sc * 3 + chain) * 2 + t];
                EXPECT_EQ(r.csi.row(0)[r.csi_index(sc, perm[chain], t)], cdouble(raw.real(), raw.imag()));
            }
}

TEST_F(IntelCapture, PermutedCaptureMatchesIdentityCapture) {
    const IntelBfee plain = intel_sample(1);
    IntelBfee permuted = plain;
    permuted.antenna_sel = antenna_sel(1, 2, 0);
    const unsigned perm[3] = {1, 2, 0};
    // Raw chain r lands on antenna perm[r], so feed it antenna perm[r]'s data.
    for (unsigned sc = 0; sc < rx::INTEL_SUBCARRIERS; ++sc)
        for (unsigned chain = 0; chain < 3; ++chain)
            for (unsigned t = 0; t < 2; ++t)
                permuted.csi[(sc * 3 + chain) * 2 + t] = plain.csi[(sc * 3 + perm[chain]) * 2 + t];

    Bytes file;
    append(file, intel_record(plain));
    append(file, intel_record(permuted));
    Intel s(write("inv.dat", file), rx::IntelFormat{}, quiet());
    s.read();
    ASSERT_EQ(s.count(), 2u);
    const auto a = s.records().csi.row(0);
    const auto b = s.records().csi.row(1);
    EXPECT_TRUE(std::equal(a.begin(), a.end(), b.begin()));
}

TEST_F(IntelCapture, InvalidPermutationKeepsRawOrder) {
    IntelBfee rec = intel_sample(1);
    rec.antenna_sel = antenna_sel(0, 0, 1);
    Intel s(write("dup.dat", intel_record(rec)), rx::IntelFormat{}, quiet());
    s.read();
    expect_csi(s.records(), 0, rec);
}

TEST(IntelRealtime, LatestOnlyWhenUnbounded) {
    Intel s(std::nullopt, rx::IntelFormat{}, rx::SessionOptions{false, 0});
    for (uint16_t n = 1; n <= 3; ++n) EXPECT_EQ(s.pmsg(intel_record(intel_sample(n))), rx::INTEL_CODE_BFEE);
    ASSERT_EQ(s.count(), 1u);
    EXPECT_EQ(s.records().bfee_count[0], 3);
    EXPECT_EQ(s.records().size(), 1u);
}

TEST(IntelRealtime, BoundedRejectsNewest) {
    Intel s(std::nullopt, rx::IntelFormat{}, rx::SessionOptions{false, 2});
    EXPECT_EQ(s.pmsg(intel_record(intel_sample(1))), rx::INTEL_CODE_BFEE);
    EXPECT_EQ(s.pmsg(intel_record(intel_sample(2))), rx::INTEL_CODE_BFEE);
    EXPECT_EQ(s.pmsg(intel_record(intel_sample(3))), 0);
    ASSERT_EQ(s.count(), 2u);
    EXPECT_EQ(s.records().bfee_count[0], 1);
    EXPECT_EQ(s.records().bfee_count[1], 2);
    EXPECT_EQ(s.report().stop, DecodeStatus::CapacityReached);
}

TEST(IntelRealtime, MacDatagramAttachesToLatest) {
    Intel s(std::nullopt, rx::IntelFormat(rx::IntelParams{3, 2, 4}), rx::SessionOptions{false, 4});
    EXPECT_EQ(s.pmsg(intel_frame(rx::INTEL_CODE_MAC, mac_frame(0x88, 7, 0))), 0);
    s.pmsg(intel_record(intel_sample(1)));
    EXPECT_EQ(s.pmsg(intel_frame(rx::INTEL_CODE_MAC, mac_frame(0x88, 7, 0))), rx::INTEL_CODE_MAC);
    ASSERT_EQ(s.count(), 1u);
    EXPECT_EQ(s.records().seq[0], 7);
    EXPECT_EQ(s.records().fc[0], 0x88);
}

TEST(IntelRealtime, DropsCountedAcrossDatagrams) {
    Intel s(std::nullopt, rx::IntelFormat{}, rx::SessionOptions{false, 4});
    s.pmsg(intel_record(intel_sample(10)));
    s.pmsg(intel_record(intel_sample(13)));
    EXPECT_EQ(s.report().dropped, 2u);
}

TEST(IntelRealtime, RejectsShortDatagram) {
    Intel s(std::nullopt, rx::IntelFormat{}, rx::SessionOptions{false, 2});
    Bytes d = intel_record(intel_sample(1));
    d.resize(30);
    EXPECT_EQ(s.pmsg(d), 0);
    EXPECT_EQ(s.count(), 0u);
    EXPECT_EQ(s.records().size(), 0u);
}

TEST_F(IntelCapture, ReadstpFillsTimestamps) {
    write("log.datstp", sidecar({{100, 500000}, {101, 0}, {102, 250000}}, ByteOrder::Little));
    Intel s(path_, rx::IntelFormat{}, quiet());
    s.read();
    EXPECT_DOUBLE_EQ(s.readstp(), 100.5);
    EXPECT_DOUBLE_EQ(s.records().stp[1], 101.0);
    EXPECT_DOUBLE_EQ(s.records().stp[2], 102.25);
}

TEST_F(IntelCapture, ReadstpBigEndian) {
    write("log.datstp", sidecar({{7, 1}}, ByteOrder::Big));
    Intel s(path_, rx::IntelFormat{}, quiet());
    s.read();
    EXPECT_DOUBLE_EQ(s.readstp(ByteOrder::Big), 7.000001);
    EXPECT_DOUBLE_EQ(s.records().stp[1], 0.0);
}

TEST_F(IntelCapture, ReadstpErrors) {
    Intel s(path_, rx::IntelFormat{}, quiet());
    EXPECT_THROW(s.readstp(), MissingSidecar);
    write("log.datstp", Bytes(5, 0));
    EXPECT_THROW(s.readstp(), TruncatedInputError);
}

TEST(IntelSession, FileErrors) {
    Intel none(std::nullopt, rx::IntelFormat{}, rx::SessionOptions{false, 0});
    EXPECT_THROW(none.read(), csi::Error);
    Intel missing(std::filesystem::path("/nonexistent/csi.dat"), rx::IntelFormat{}, rx::SessionOptions{false, 0});
    EXPECT_THROW(missing.read(), csi::Error);
}

TEST(IntelSession, RejectsAntennaCounts) {
    EXPECT_THROW(rx::IntelFormat(rx::IntelParams{4, 2, 0}), UnsupportedProfile);
    EXPECT_THROW(rx::IntelFormat(rx::IntelParams{3, 0, 0}), UnsupportedProfile);
}

TEST(IntelSession, CsiLengthFormula) {
    EXPECT_EQ(rx::intel_csi_length(3, 2), 372u);
    EXPECT_EQ(rx::intel_csi_length(1, 1), 72u);
}
