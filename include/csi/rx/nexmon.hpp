#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include "csi/record_buffer.hpp"
#include "csi/rx/frame.hpp"
#include "csi/rx/pcap.hpp"
#include "csi/status.hpp"

namespace csi::rx {

// nexmon_csi UDP stream, stored in pcap files.
inline constexpr uint16_t NEXMON_PMSG_OK = 0xf100;
inline constexpr uint16_t NEXMON_UDP_PORT = 5500;
inline constexpr std::size_t NEXMON_META_LEN = 18;

enum class Chip { BCM4339, BCM43455C0, BCM4358, BCM4366C0 };

// CSI word layout produced by the chip firmware.
enum class CsiWord { Int16, PackedFloat };

struct ChipProfile {
    Chip chip;
    unsigned bw;     // MHz
    unsigned nfft;   // subcarriers per packet
    CsiWord word;
};

// Throws UnsupportedProfile for names outside {4339, 43455c0, 4358, 4366c0}.
Chip parse_chip(const std::string& name);
const char* chip_name(Chip chip);

// Throws UnsupportedProfile when (chip, bw) has no subcarrier mapping.
const ChipProfile& lookup_profile(Chip chip, unsigned bw);

struct NexmonParams {
    Chip chip{Chip::BCM43455C0};
    unsigned bw{80};
    bool autoscale{true}; // packed-float chips only
};

struct NexmonRecords : ColumnStore<NexmonRecords> {
    NexmonRecords() = default;
    explicit NexmonRecords(const ChipProfile& p);

    Column<uint32_t> sec;
    Column<uint32_t> usec;
    Column<uint32_t> caplen;
    Column<uint32_t> wirelen;
    Column<uint32_t> magic;
    Column<uint8_t>  src_addr{Shape{6}};
    Column<uint16_t> seq;
    Column<uint8_t>  core;
    Column<uint8_t>  spatial;
    Column<uint16_t> chan_spec;
    Column<uint16_t> chip_version;
    Column<int32_t>  rssi; // pull 46 only
    Column<uint8_t>  fc;   // pull 46 only
    Column<cdouble>  csi;  // (nfft)
    Column<uint64_t> offset;

    unsigned nfft{256};

    template <class F> void for_each_column(F&& f) { visit(*this, f); }
    template <class F> void for_each_column(F&& f) const { visit(*this, f); }

private:
    template <class Self, class F>
    static void visit(Self& s, F& f) {
        f("offset", s.offset);
        f("sec", s.sec);
        f("usec", s.usec);
        f("caplen", s.caplen);
        f("wirelen", s.wirelen);
        f("magic", s.magic);
        f("src_addr", s.src_addr);
        f("seq", s.seq);
        f("core", s.core);
        f("spatial", s.spatial);
        f("chan_spec", s.chan_spec);
        f("chip_version", s.chip_version);
        f("rssi", s.rssi);
        f("fc", s.fc);
        f("csi", s.csi);
    }
};

// pcap container: global header, then (16-byte packet header, caplen
// bytes) pairs. Only IPv4/UDP frames to NEXMON_UDP_PORT are CSI packets.
class NexmonFormat {
public:
    using Records = NexmonRecords;
    using Params = NexmonParams;

    static constexpr std::size_t kPrefixSize = pcap::PACKET_HEADER_LEN;
    static constexpr bool kResyncOnMalformed = true;
    static constexpr bool kHasSidecar = false;
    static constexpr const char* kName = "nexmon";

    explicit NexmonFormat(const NexmonParams& p = {});

    const NexmonParams& params() const { return params_; }
    const ChipProfile& profile() const { return *profile_; }
    Records make_records() const { return Records(*profile_); }

    // Reads and validates the pcap global header; throws csi::Error on a
    // bad magic or a non-Ethernet link type.
    uint64_t open(std::istream& in);

    bool nano() const { return pcap_.nano; }

    BodyLength body_size(std::span<const uint8_t> prefix, utils::ByteOrder order) const;

    DecodeStatus decode(const Frame& frame, Records& out, const Target& target, ReadReport& report) const;

    // `data` is one Ethernet frame as received from a raw socket.
    uint16_t parse_datagram(std::span<const uint8_t> data, utils::ByteOrder order,
                            Records& out, const Target& target, ReadReport& report,
                            DecodeStatus& status) const;

private:
    DecodeStatus decode_frame(std::span<const uint8_t> frame, utils::ByteOrder order,
                              Records& out, std::size_t slot) const;

    NexmonParams params_;
    const ChipProfile* profile_;
    pcap::GlobalHeader pcap_{};
};

} // namespace csi::rx
