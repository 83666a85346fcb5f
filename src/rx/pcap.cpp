#include "csi/rx/pcap.hpp"

namespace csi::rx::pcap {

using utils::ByteOrder;
using utils::load_u16;
using utils::load_u32;

namespace {
constexpr std::size_t ETH_HEADER_LEN = 14;
constexpr std::size_t UDP_HEADER_LEN = 8;
constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint8_t IPPROTO_UDP_ = 17;
} // namespace

std::optional<GlobalHeader> parse_global_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < GLOBAL_HEADER_LEN) return std::nullopt;
    GlobalHeader h;
    const uint32_t le = load_u32(bytes.data(), ByteOrder::Little);
    const uint32_t be = load_u32(bytes.data(), ByteOrder::Big);
    if (le == MAGIC_USEC || le == MAGIC_NSEC) {
        h.order = ByteOrder::Little;
        h.nano = le == MAGIC_NSEC;
    } else if (be == MAGIC_USEC || be == MAGIC_NSEC) {
        h.order = ByteOrder::Big;
        h.nano = be == MAGIC_NSEC;
    } else {
        return std::nullopt;
    }
    h.version_major = load_u16(bytes.data() + 4, h.order);
    h.version_minor = load_u16(bytes.data() + 6, h.order);
    h.snaplen = load_u32(bytes.data() + 16, h.order);
    h.network = load_u32(bytes.data() + 20, h.order);
    return h;
}

PacketHeader parse_packet_header(std::span<const uint8_t> bytes, ByteOrder order) {
    PacketHeader h;
    h.ts_sec = load_u32(bytes.data(), order);
    h.ts_usec = load_u32(bytes.data() + 4, order);
    h.incl_len = load_u32(bytes.data() + 8, order);
    h.orig_len = load_u32(bytes.data() + 12, order);
    return h;
}

std::optional<std::size_t> udp_payload_offset(std::span<const uint8_t> frame, uint16_t dst_port) {
    if (frame.size() < ETH_HEADER_LEN + 20 + UDP_HEADER_LEN) return std::nullopt;
    if (load_u16(frame.data() + 12, ByteOrder::Big) != ETHERTYPE_IPV4) return std::nullopt;
    const uint8_t* ip = frame.data() + ETH_HEADER_LEN;
    if ((ip[0] >> 4) != 4) return std::nullopt;
    const std::size_t ihl = std::size_t(ip[0] & 0x0f) * 4;
    if (ihl < 20 || ip[9] != IPPROTO_UDP_) return std::nullopt;
    const std::size_t udp_at = ETH_HEADER_LEN + ihl;
    if (frame.size() < udp_at + UDP_HEADER_LEN) return std::nullopt;
    if (load_u16(frame.data() + udp_at + 2, ByteOrder::Big) != dst_port) return std::nullopt;
    return udp_at + UDP_HEADER_LEN;
}

} // namespace csi::rx::pcap
