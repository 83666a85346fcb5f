#include "csi/rx/atheros.hpp"

#include <algorithm>
#include <string>
#include "csi/debug.hpp"
#include "csi/utils/bitstream.hpp"

namespace csi::rx {

using utils::ByteOrder;
using utils::load_u16;
using utils::load_u64;

AtherosRecords::AtherosRecords(const AtherosParams& p)
    : csi(Shape{p.tones, p.nrxnum, p.ntxnum}),
      payload(Shape{p.pl_size}),
      tones(p.tones),
      nrxnum(p.nrxnum),
      ntxnum(p.ntxnum) {}

AtherosFormat::AtherosFormat(const AtherosParams& p) : params_(p) {
    if (p.tones != 56 && p.tones != 114)
        throw UnsupportedProfile("atheros: tones must be 56 or 114, got " + std::to_string(p.tones));
    if (p.nrxnum < 1 || p.nrxnum > 3 || p.ntxnum < 1 || p.ntxnum > 3)
        throw UnsupportedProfile("atheros: nrxnum/ntxnum must be in 1..3");
}

BodyLength AtherosFormat::body_size(std::span<const uint8_t> prefix, ByteOrder order) const {
    const uint16_t field_len = load_u16(prefix.data(), order);
    if (field_len < ATHEROS_HEADER_LEN) return {0, DecodeStatus::EndOfStream};
    return {field_len};
}

DecodeStatus AtherosFormat::decode(const Frame& frame, Records& out, const Target& target,
                                   ReadReport&) const {
    const auto body = frame.body;
    const ByteOrder o = frame.order;
    if (body.size() < ATHEROS_HEADER_LEN) {
        debug::set_fail(debug::kFailShortBody);
        return DecodeStatus::TruncatedInput;
    }
    const uint8_t* b = body.data();
    const std::size_t slot = target.slot;

    const uint16_t csi_len = load_u16(b + 8, o);
    const uint16_t payload_len = load_u16(b + 23, o);
    const unsigned num_tones = b[16];
    const unsigned nr = b[17];
    const unsigned nc = b[18];

    if (ATHEROS_HEADER_LEN + std::size_t(csi_len) + payload_len > body.size()) {
        debug::set_fail(debug::kFailLength);
        CSI_TRACEF("atheros: record at %llu declares %u+%u bytes, has %zu",
                   (unsigned long long)frame.offset, csi_len, payload_len, body.size() - ATHEROS_HEADER_LEN);
        return DecodeStatus::TruncatedInput;
    }
    if (csi_len > 0) {
        if (nr == 0 || nc == 0 || nr > params_.nrxnum || nc > params_.ntxnum || num_tones != params_.tones ||
            csi_len < atheros_csi_length(num_tones, nr, nc)) {
            debug::set_fail(debug::kFailShape);
            CSI_TRACEF("atheros: shape %ux%ux%u does not fit %ux%ux%u in %u bytes",
                       num_tones, nr, nc, params_.tones, params_.nrxnum, params_.ntxnum, csi_len);
            return DecodeStatus::TruncatedInput;
        }
    }

    out.offset[slot] = frame.offset;
    out.timestamp[slot] = load_u64(b, o);
    out.csi_len[slot] = csi_len;
    out.tx_channel[slot] = load_u16(b + 10, o);
    out.err_info[slot] = b[12];
    out.noise_floor[slot] = b[13];
    out.rate[slot] = b[14];
    out.bandwidth[slot] = b[15];
    out.num_tones[slot] = uint8_t(num_tones);
    out.nr[slot] = uint8_t(nr);
    out.nc[slot] = uint8_t(nc);
    out.rssi[slot] = b[19];
    out.rssi_1[slot] = b[20];
    out.rssi_2[slot] = b[21];
    out.rssi_3[slot] = b[22];
    out.payload_len[slot] = payload_len;

    if (csi_len > 0) {
        // Imaginary part first; receive antenna varies fastest.
        utils::BitCursor cur(body.subspan(ATHEROS_HEADER_LEN, csi_len), o, 2);
        auto csi = out.csi.row(slot);
        for (unsigned k = 0; k < num_tones; ++k) {
            for (unsigned tx = 0; tx < nc; ++tx) {
                for (unsigned rx = 0; rx < nr; ++rx) {
                    auto im = cur.read_signed(ATHEROS_BITS_PER_SYMBOL);
                    auto re = cur.read_signed(ATHEROS_BITS_PER_SYMBOL);
                    if (!im || !re) {
                        debug::set_fail(debug::kFailShortBody);
                        return DecodeStatus::TruncatedInput;
                    }
                    csi[out.csi_index(k, rx, tx)] = cdouble(*re, *im);
                }
            }
        }
    }

    auto pl = out.payload.row(slot);
    const auto src = body.subspan(ATHEROS_HEADER_LEN + csi_len, payload_len);
    const std::size_t n = std::min(pl.size(), src.size());
    std::copy(src.begin(), src.begin() + n, pl.begin());
    return DecodeStatus::Ok;
}

uint16_t AtherosFormat::parse_datagram(std::span<const uint8_t> data, ByteOrder order, Records& out,
                                       const Target& target, ReadReport& report, DecodeStatus& status) const {
    if (data.size() < kPrefixSize) {
        status = DecodeStatus::TruncatedInput;
        return 0;
    }
    const auto body_len = body_size(data.first(kPrefixSize), order);
    if (body_len.stop != DecodeStatus::Ok) {
        status = DecodeStatus::UnrecognizedFraming;
        return 0;
    }
    if (data.size() - kPrefixSize < body_len.len) {
        debug::set_fail(debug::kFailShortBody);
        status = DecodeStatus::TruncatedInput;
        return 0;
    }
    Frame frame{data.first(kPrefixSize), data.subspan(kPrefixSize, body_len.len), order, 0};
    status = decode(frame, out, target, report);
    return status == DecodeStatus::Ok ? ATHEROS_PMSG_OK : 0;
}

} // namespace csi::rx
