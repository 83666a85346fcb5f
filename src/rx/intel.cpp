#include "csi/rx/intel.hpp"

#include <algorithm>
#include <array>
#include "csi/debug.hpp"
#include "csi/utils/bitstream.hpp"

namespace csi::rx {

using utils::ByteOrder;
using utils::load_u16_be;
using utils::load_u16_le;
using utils::load_u32_le;

namespace {

constexpr std::size_t BFEE_HEADER_LEN = 20;
constexpr std::size_t MAC_HEADER_LEN = 24;

// perm[0..nrx) must name every chain below nrx exactly once.
bool is_permutation(const std::array<uint8_t, 3>& perm, unsigned nrx) {
    std::array<bool, 3> seen{};
    for (unsigned r = 0; r < nrx; ++r) {
        if (perm[r] >= nrx || seen[perm[r]]) return false;
        seen[perm[r]] = true;
    }
    return true;
}

} // namespace

IntelRecords::IntelRecords(const IntelParams& p)
    : csi(Shape{INTEL_SUBCARRIERS, p.nrxnum, p.ntxnum}),
      payload(Shape{p.pl_size}),
      nrxnum(p.nrxnum),
      ntxnum(p.ntxnum) {}

IntelFormat::IntelFormat(const IntelParams& p) : params_(p) {
    if (p.nrxnum < 1 || p.nrxnum > 3 || p.ntxnum < 1 || p.ntxnum > 3)
        throw UnsupportedProfile("intel: nrxnum/ntxnum must be in 1..3");
}

BodyLength IntelFormat::body_size(std::span<const uint8_t> prefix, ByteOrder) const {
    const uint16_t field_len = load_u16_be(prefix.data());
    // The length covers the code byte as well. A zero length frames no
    // body; decode() rejects it and the batch resumes after the prefix.
    if (field_len == 0) return {0};
    return {std::size_t(field_len) - 1};
}

DecodeStatus IntelFormat::decode(const Frame& frame, Records& out, const Target& target,
                                 ReadReport& report) const {
    if (load_u16_be(frame.prefix.data()) == 0) {
        debug::set_fail(debug::kFailLength);
        CSI_TRACEF("intel: zero-length frame at offset %llu", (unsigned long long)frame.offset);
        return DecodeStatus::TruncatedInput;
    }
    const uint8_t code = frame.prefix[2];
    if (code == INTEL_CODE_MAC) {
        if (target.previous) decode_mac_frame(frame.body, out, *target.previous);
        return DecodeStatus::Auxiliary;
    }
    if (code != INTEL_CODE_BFEE) {
        debug::set_fail(debug::kFailFraming);
        CSI_TRACEF("intel: skipping code 0x%02x at offset %llu", code, (unsigned long long)frame.offset);
        return DecodeStatus::UnrecognizedFraming;
    }

    const DecodeStatus st = decode_bfee(frame.body, out, target.slot);
    if (st != DecodeStatus::Ok) return st;
    out.offset[target.slot] = frame.offset;

    if (target.run_previous) {
        const uint16_t gap = uint16_t(out.bfee_count[target.slot] - out.bfee_count[*target.run_previous]);
        if (gap > 1) report.dropped += gap - 1;
    }
    return DecodeStatus::Ok;
}

DecodeStatus IntelFormat::decode_bfee(std::span<const uint8_t> body, Records& out, std::size_t slot) const {
    if (body.size() < BFEE_HEADER_LEN) {
        debug::set_fail(debug::kFailShortBody);
        return DecodeStatus::TruncatedInput;
    }
    const uint8_t* b = body.data();
    const unsigned nrx = b[8];
    const unsigned ntx = b[9];
    const uint16_t csi_len = load_u16_le(b + 16);

    if (nrx == 0 || ntx == 0 || nrx > params_.nrxnum || ntx > params_.ntxnum) {
        debug::set_fail(debug::kFailShape);
        CSI_TRACEF("intel: antenna shape %ux%u exceeds %ux%u", nrx, ntx, params_.nrxnum, params_.ntxnum);
        return DecodeStatus::TruncatedInput;
    }
    const std::size_t calc_len = intel_csi_length(nrx, ntx);
    if (csi_len != calc_len || body.size() < BFEE_HEADER_LEN + calc_len) {
        debug::set_fail(debug::kFailLength);
        CSI_TRACEF("intel: csi length %u, expected %zu", csi_len, calc_len);
        return DecodeStatus::TruncatedInput;
    }

    out.timestamp_low[slot] = load_u32_le(b);
    out.bfee_count[slot] = load_u16_le(b + 4);
    out.nrx[slot] = uint8_t(nrx);
    out.ntx[slot] = uint8_t(ntx);
    out.rssi_a[slot] = b[10];
    out.rssi_b[slot] = b[11];
    out.rssi_c[slot] = b[12];
    out.noise[slot] = static_cast<int8_t>(b[13]);
    out.agc[slot] = b[14];
    out.rate[slot] = load_u16_le(b + 18);

    const uint8_t antenna_sel = b[15];
    std::array<uint8_t, 3> perm{};
    for (unsigned r = 0; r < 3; ++r) perm[r] = (antenna_sel >> (2 * r)) & 0x3;
    std::copy(perm.begin(), perm.end(), out.perm.row(slot).begin());
    const bool reorder = is_permutation(perm, nrx);

    // Each subcarrier: 3 pad bits, then Nrx*Ntx (real, imag) 8-bit pairs.
    utils::BitCursor cur(body.subspan(BFEE_HEADER_LEN, calc_len));
    auto csi = out.csi.row(slot);
    for (std::size_t sc = 0; sc < INTEL_SUBCARRIERS; ++sc) {
        if (!cur.skip(3)) {
            debug::set_fail(debug::kFailShortBody);
            return DecodeStatus::TruncatedInput;
        }
        for (unsigned rx = 0; rx < nrx; ++rx) {
            const unsigned ant = reorder ? perm[rx] : rx;
            for (unsigned tx = 0; tx < ntx; ++tx) {
                auto re = cur.read_signed(8);
                auto im = cur.read_signed(8);
                if (!re || !im) {
                    debug::set_fail(debug::kFailShortBody);
                    return DecodeStatus::TruncatedInput;
                }
                csi[out.csi_index(sc, ant, tx)] = cdouble(*re, *im);
            }
        }
    }

    const std::size_t mac_at = BFEE_HEADER_LEN + calc_len;
    if (body.size() > mac_at) decode_mac_frame(body.subspan(mac_at), out, slot);
    return DecodeStatus::Ok;
}

void IntelFormat::decode_mac_frame(std::span<const uint8_t> frame, Records& out, std::size_t slot) const {
    if (frame.size() >= MAC_HEADER_LEN) {
        const uint8_t* f = frame.data();
        out.fc[slot] = load_u16_le(f);
        out.dur[slot] = load_u16_le(f + 2);
        std::copy(f + 4, f + 10, out.addr_des.row(slot).begin());
        std::copy(f + 10, f + 16, out.addr_src.row(slot).begin());
        std::copy(f + 16, f + 22, out.addr_bssid.row(slot).begin());
        out.seq[slot] = load_u16_le(f + 22) >> 4;
    }
    auto pl = out.payload.row(slot);
    const std::size_t n = std::min(pl.size(), frame.size());
    std::copy(frame.begin(), frame.begin() + n, pl.begin());
    std::fill(pl.begin() + n, pl.end(), uint8_t{0});
}

uint16_t IntelFormat::parse_datagram(std::span<const uint8_t> data, ByteOrder order, Records& out,
                                     const Target& target, ReadReport& report, DecodeStatus& status) const {
    if (data.size() < kPrefixSize) {
        status = DecodeStatus::TruncatedInput;
        return 0;
    }
    const auto body_len = body_size(data.first(kPrefixSize), order);
    if (data.size() - kPrefixSize < body_len.len) {
        debug::set_fail(debug::kFailShortBody);
        status = DecodeStatus::TruncatedInput;
        return 0;
    }
    Frame frame{data.first(kPrefixSize), data.subspan(kPrefixSize, body_len.len), order, 0};
    status = decode(frame, out, target, report);
    if (status == DecodeStatus::Ok) return INTEL_CODE_BFEE;
    if (status == DecodeStatus::Auxiliary && target.previous) return INTEL_CODE_MAC;
    return 0;
}

} // namespace csi::rx
