#include "csi/rx/nexmon.hpp"

#include <algorithm>
#include <array>
#include <vector>
#include "csi/debug.hpp"
#include "csi/utils/nexmon_float.hpp"

namespace csi::rx {

using utils::ByteOrder;
using utils::load_u16;
using utils::load_u32;

namespace {

constexpr std::array<ChipProfile, 12> kProfiles{{
    {Chip::BCM4339,    20,  64, CsiWord::Int16},
    {Chip::BCM4339,    40, 128, CsiWord::Int16},
    {Chip::BCM4339,    80, 256, CsiWord::Int16},
    {Chip::BCM43455C0, 20,  64, CsiWord::Int16},
    {Chip::BCM43455C0, 40, 128, CsiWord::Int16},
    {Chip::BCM43455C0, 80, 256, CsiWord::Int16},
    {Chip::BCM4358,    20,  64, CsiWord::PackedFloat},
    {Chip::BCM4358,    40, 128, CsiWord::PackedFloat},
    {Chip::BCM4358,    80, 256, CsiWord::PackedFloat},
    {Chip::BCM4366C0,  20,  64, CsiWord::PackedFloat},
    {Chip::BCM4366C0,  40, 128, CsiWord::PackedFloat},
    {Chip::BCM4366C0,  80, 256, CsiWord::PackedFloat},
}};

} // namespace

Chip parse_chip(const std::string& name) {
    if (name == "4339") return Chip::BCM4339;
    if (name == "43455c0") return Chip::BCM43455C0;
    if (name == "4358") return Chip::BCM4358;
    if (name == "4366c0") return Chip::BCM4366C0;
    throw UnsupportedProfile("nexmon: unsupported chip '" + name + "'");
}

const char* chip_name(Chip chip) {
    switch (chip) {
        case Chip::BCM4339: return "4339";
        case Chip::BCM43455C0: return "43455c0";
        case Chip::BCM4358: return "4358";
        case Chip::BCM4366C0: return "4366c0";
    }
    return "unknown";
}

const ChipProfile& lookup_profile(Chip chip, unsigned bw) {
    auto it = std::find_if(kProfiles.begin(), kProfiles.end(),
                           [&](const ChipProfile& p) { return p.chip == chip && p.bw == bw; });
    if (it == kProfiles.end())
        throw UnsupportedProfile(std::string("nexmon: chip ") + chip_name(chip) + " has no " +
                                 std::to_string(bw) + " MHz profile");
    return *it;
}

NexmonRecords::NexmonRecords(const ChipProfile& p) : csi(Shape{p.nfft}), nfft(p.nfft) {}

NexmonFormat::NexmonFormat(const NexmonParams& p)
    : params_(p), profile_(&lookup_profile(p.chip, p.bw)) {}

uint64_t NexmonFormat::open(std::istream& in) {
    std::array<uint8_t, pcap::GLOBAL_HEADER_LEN> hdr{};
    in.read(reinterpret_cast<char*>(hdr.data()), hdr.size());
    if (in.gcount() != static_cast<std::streamsize>(hdr.size())) {
        debug::set_fail(debug::kFailPcapHeader);
        throw Error("nexmon: file too short for a pcap header");
    }
    auto g = pcap::parse_global_header(hdr);
    if (!g) {
        debug::set_fail(debug::kFailPcapHeader);
        throw Error("nexmon: not a pcap file (bad magic)");
    }
    if (g->network != pcap::LINKTYPE_ETHERNET)
        throw Error("nexmon: unsupported pcap link type " + std::to_string(g->network));
    pcap_ = *g;
    return pcap::GLOBAL_HEADER_LEN;
}

BodyLength NexmonFormat::body_size(std::span<const uint8_t> prefix, ByteOrder) const {
    const auto h = pcap::parse_packet_header(prefix, pcap_.order);
    if (h.incl_len > pcap::MAX_SNAPLEN) {
        // A corrupt packet header leaves no way to find the next packet.
        debug::set_fail(debug::kFailLength);
        CSI_TRACEF("nexmon: caplen %u exceeds snaplen %u", h.incl_len, pcap::MAX_SNAPLEN);
        return {0, DecodeStatus::TruncatedInput};
    }
    return {h.incl_len};
}

DecodeStatus NexmonFormat::decode(const Frame& frame, Records& out, const Target& target, ReadReport&) const {
    const auto h = pcap::parse_packet_header(frame.prefix, pcap_.order);
    // The CSI payload itself is written little-endian by the firmware.
    const DecodeStatus st = decode_frame(frame.body, ByteOrder::Little, out, target.slot);
    if (st != DecodeStatus::Ok) return st;
    out.sec[target.slot] = h.ts_sec;
    out.usec[target.slot] = h.ts_usec;
    out.caplen[target.slot] = h.incl_len;
    out.wirelen[target.slot] = h.orig_len;
    out.offset[target.slot] = frame.offset;
    return DecodeStatus::Ok;
}

DecodeStatus NexmonFormat::decode_frame(std::span<const uint8_t> frame, ByteOrder o,
                                        Records& out, std::size_t slot) const {
    const auto at = pcap::udp_payload_offset(frame, NEXMON_UDP_PORT);
    if (!at) {
        debug::set_fail(debug::kFailFraming);
        return DecodeStatus::UnrecognizedFraming;
    }
    const auto udp = frame.subspan(*at);
    const std::size_t nfft = profile_->nfft;
    if (udp.size() < NEXMON_META_LEN + nfft * 4) {
        debug::set_fail(debug::kFailShape);
        CSI_TRACEF("nexmon: %zu payload bytes, need %zu", udp.size(), NEXMON_META_LEN + nfft * 4);
        return DecodeStatus::TruncatedInput;
    }

    const uint8_t* p = udp.data();
    out.magic[slot] = load_u32(p, o);
    std::copy(p + 4, p + 10, out.src_addr.row(slot).begin());
    out.seq[slot] = load_u16(p + 10, o);
    const uint16_t core_spatial = load_u16(p + 12, o);
    out.core[slot] = uint8_t(core_spatial & 0x7);
    out.spatial[slot] = uint8_t((core_spatial >> 3) & 0x7);
    out.chan_spec[slot] = load_u16(p + 14, o);
    out.chip_version[slot] = load_u16(p + 16, o);

    const uint8_t* words = p + NEXMON_META_LEN;
    auto csi = out.csi.row(slot);
    if (profile_->word == CsiWord::Int16) {
        for (std::size_t k = 0; k < nfft; ++k) {
            const auto re = static_cast<int16_t>(load_u16(words + 4 * k, o));
            const auto im = static_cast<int16_t>(load_u16(words + 4 * k + 2, o));
            csi[k] = cdouble(re, im);
        }
    } else {
        std::vector<uint32_t> packed(nfft);
        for (std::size_t k = 0; k < nfft; ++k) packed[k] = load_u32(words + 4 * k, o);
        std::vector<int32_t> iq(2 * nfft);
        utils::PackedFloatFormat fmt;
        fmt.autoscale = params_.autoscale;
        utils::unpack_float_acphy(packed, iq, fmt);
        for (std::size_t k = 0; k < nfft; ++k) csi[k] = cdouble(iq[2 * k], iq[2 * k + 1]);
    }
    return DecodeStatus::Ok;
}

uint16_t NexmonFormat::parse_datagram(std::span<const uint8_t> data, ByteOrder order, Records& out,
                                      const Target& target, ReadReport&, DecodeStatus& status) const {
    status = decode_frame(data, order, out, target.slot);
    if (status != DecodeStatus::Ok) return 0;
    out.caplen[target.slot] = uint32_t(data.size());
    out.wirelen[target.slot] = uint32_t(data.size());
    return NEXMON_PMSG_OK;
}

} // namespace csi::rx
