#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include "csi/record_buffer.hpp"
#include "csi/rx/frame.hpp"
#include "csi/status.hpp"

namespace csi::rx {

// Linux 802.11n CSI Tool (Intel 5300) log_to_file records.
inline constexpr uint8_t INTEL_CODE_BFEE = 0xbb;
inline constexpr uint8_t INTEL_CODE_MAC  = 0xc1;
inline constexpr std::size_t INTEL_SUBCARRIERS = 30;

struct IntelParams {
    unsigned nrxnum{3};
    unsigned ntxnum{2};
    std::size_t pl_size{0}; // MAC frame bytes kept per record
};

struct IntelRecords : ColumnStore<IntelRecords> {
    IntelRecords() = default;
    explicit IntelRecords(const IntelParams& p);

    Column<uint32_t> timestamp_low;
    Column<uint16_t> bfee_count;
    Column<uint8_t>  nrx;
    Column<uint8_t>  ntx;
    Column<uint8_t>  rssi_a;
    Column<uint8_t>  rssi_b;
    Column<uint8_t>  rssi_c;
    Column<int8_t>   noise;
    Column<uint8_t>  agc;
    Column<uint8_t>  perm{Shape{3}};
    Column<uint16_t> rate;
    Column<cdouble>  csi;    // (30, nrxnum, ntxnum)
    Column<double>   stp;    // filled by readstp
    Column<uint16_t> fc;
    Column<uint16_t> dur;
    Column<uint8_t>  addr_des{Shape{6}};
    Column<uint8_t>  addr_src{Shape{6}};
    Column<uint8_t>  addr_bssid{Shape{6}};
    Column<uint16_t> seq;
    Column<uint8_t>  payload;
    Column<uint64_t> offset;

    unsigned nrxnum{3};
    unsigned ntxnum{2};

    std::size_t csi_index(std::size_t sc, std::size_t rx, std::size_t tx) const {
        return (sc * nrxnum + rx) * ntxnum + tx;
    }

    template <class F> void for_each_column(F&& f) { visit(*this, f); }
    template <class F> void for_each_column(F&& f) const { visit(*this, f); }

private:
    template <class Self, class F>
    static void visit(Self& s, F& f) {
        f("offset", s.offset);
        f("timestamp_low", s.timestamp_low);
        f("bfee_count", s.bfee_count);
        f("Nrx", s.nrx);
        f("Ntx", s.ntx);
        f("rssi_a", s.rssi_a);
        f("rssi_b", s.rssi_b);
        f("rssi_c", s.rssi_c);
        f("noise", s.noise);
        f("agc", s.agc);
        f("perm", s.perm);
        f("rate", s.rate);
        f("csi", s.csi);
        f("stp", s.stp);
        f("fc", s.fc);
        f("dur", s.dur);
        f("addr_des", s.addr_des);
        f("addr_src", s.addr_src);
        f("addr_bssid", s.addr_bssid);
        f("seq", s.seq);
        f("payload", s.payload);
    }
};

// Decoder for the 0xbb / 0xc1 framed stream: 2-byte big-endian length,
// 1-byte code, then length-1 body bytes.
class IntelFormat {
public:
    using Records = IntelRecords;
    using Params = IntelParams;

    static constexpr std::size_t kPrefixSize = 3;
    static constexpr bool kResyncOnMalformed = true;
    static constexpr bool kHasSidecar = true;
    static constexpr const char* kName = "intel";

    // Throws UnsupportedProfile for antenna counts outside 1..3.
    explicit IntelFormat(const IntelParams& p = {});

    const IntelParams& params() const { return params_; }
    Records make_records() const { return Records(params_); }

    // No file header; records start at byte 0.
    uint64_t open(std::istream&) { return 0; }

    BodyLength body_size(std::span<const uint8_t> prefix, utils::ByteOrder) const;

    DecodeStatus decode(const Frame& frame, Records& out, const Target& target, ReadReport& report) const;

    // Real-time datagram carrying one framed record. Returns the record's
    // code (0xbb / 0xc1) when it was stored, 0 otherwise.
    uint16_t parse_datagram(std::span<const uint8_t> data, utils::ByteOrder order,
                            Records& out, const Target& target, ReadReport& report,
                            DecodeStatus& status) const;

private:
    DecodeStatus decode_bfee(std::span<const uint8_t> body, Records& out, std::size_t slot) const;
    void decode_mac_frame(std::span<const uint8_t> frame, Records& out, std::size_t slot) const;

    IntelParams params_;
};

// Expected CSI payload length for an Nrx x Ntx beamforming report.
inline std::size_t intel_csi_length(unsigned nrx, unsigned ntx) {
    return (INTEL_SUBCARRIERS * (nrx * ntx * 16 + 3) + 7) / 8;
}

} // namespace csi::rx
