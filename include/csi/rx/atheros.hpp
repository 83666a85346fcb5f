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

// Atheros CSI Tool (recv_csi) records.
inline constexpr uint16_t ATHEROS_PMSG_OK = 0xff00;
inline constexpr std::size_t ATHEROS_HEADER_LEN = 25;
inline constexpr unsigned ATHEROS_BITS_PER_SYMBOL = 10;

struct AtherosParams {
    unsigned nrxnum{3};
    unsigned ntxnum{2};
    std::size_t pl_size{0};
    unsigned tones{56}; // 56 (20 MHz) or 114 (40 MHz)
};

struct AtherosRecords : ColumnStore<AtherosRecords> {
    AtherosRecords() = default;
    explicit AtherosRecords(const AtherosParams& p);

    Column<uint64_t> timestamp;
    Column<uint16_t> csi_len;
    Column<uint16_t> tx_channel;
    Column<uint8_t>  err_info;
    Column<uint8_t>  noise_floor;
    Column<uint8_t>  rate;
    Column<uint8_t>  bandwidth;
    Column<uint8_t>  num_tones;
    Column<uint8_t>  nr;
    Column<uint8_t>  nc;
    Column<uint8_t>  rssi;
    Column<uint8_t>  rssi_1;
    Column<uint8_t>  rssi_2;
    Column<uint8_t>  rssi_3;
    Column<uint16_t> payload_len;
    Column<cdouble>  csi;     // (tones, nrxnum, ntxnum)
    Column<uint8_t>  payload;
    Column<double>   stp;
    Column<uint64_t> offset;

    unsigned tones{56};
    unsigned nrxnum{3};
    unsigned ntxnum{2};

    std::size_t csi_index(std::size_t k, std::size_t rx, std::size_t tx) const {
        return (k * nrxnum + rx) * ntxnum + tx;
    }

    template <class F> void for_each_column(F&& f) { visit(*this, f); }
    template <class F> void for_each_column(F&& f) const { visit(*this, f); }

private:
    template <class Self, class F>
    static void visit(Self& s, F& f) {
        f("offset", s.offset);
        f("timestamp", s.timestamp);
        f("csi_len", s.csi_len);
        f("tx_channel", s.tx_channel);
        f("err_info", s.err_info);
        f("noise_floor", s.noise_floor);
        f("Rate", s.rate);
        f("bandWidth", s.bandwidth);
        f("num_tones", s.num_tones);
        f("nr", s.nr);
        f("nc", s.nc);
        f("rssi", s.rssi);
        f("rssi_1", s.rssi_1);
        f("rssi_2", s.rssi_2);
        f("rssi_3", s.rssi_3);
        f("payload_len", s.payload_len);
        f("csi", s.csi);
        f("payload", s.payload);
        f("stp", s.stp);
    }
};

// Length-prefixed records. Every multi-byte field, including the 16-bit
// words carrying the CSI bit stream, follows the byte order selected
// for the read.
class AtherosFormat {
public:
    using Records = AtherosRecords;
    using Params = AtherosParams;

    static constexpr std::size_t kPrefixSize = 2;
    static constexpr bool kResyncOnMalformed = false;
    static constexpr bool kHasSidecar = true;
    static constexpr const char* kName = "atheros";

    // Throws UnsupportedProfile unless tones is 56 or 114.
    explicit AtherosFormat(const AtherosParams& p = {});

    const AtherosParams& params() const { return params_; }
    Records make_records() const { return Records(params_); }

    uint64_t open(std::istream&) { return 0; }

    // nullopt (end of stream) when the record is shorter than a header.
    BodyLength body_size(std::span<const uint8_t> prefix, utils::ByteOrder order) const;

    DecodeStatus decode(const Frame& frame, Records& out, const Target& target, ReadReport& report) const;

    uint16_t parse_datagram(std::span<const uint8_t> data, utils::ByteOrder order,
                            Records& out, const Target& target, ReadReport& report,
                            DecodeStatus& status) const;

private:
    AtherosParams params_;
};

// Bytes needed to hold the CSI of one record; the stream is consumed in
// whole 16-bit words.
inline std::size_t atheros_csi_length(unsigned tones, unsigned nr, unsigned nc) {
    const std::size_t bits = std::size_t(tones) * nr * nc * 2 * ATHEROS_BITS_PER_SYMBOL;
    return (bits + 15) / 16 * 2;
}

} // namespace csi::rx
