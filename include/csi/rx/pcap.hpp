#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include "csi/utils/endian.hpp"

namespace csi::rx::pcap {

inline constexpr std::size_t GLOBAL_HEADER_LEN = 24;
inline constexpr std::size_t PACKET_HEADER_LEN = 16;
inline constexpr uint32_t MAGIC_USEC = 0xa1b2c3d4;
inline constexpr uint32_t MAGIC_NSEC = 0xa1b23c4d;
inline constexpr uint32_t LINKTYPE_ETHERNET = 1;

// Largest caplen accepted before a packet header is treated as garbage.
inline constexpr uint32_t MAX_SNAPLEN = 262144;

struct GlobalHeader {
    utils::ByteOrder order{utils::ByteOrder::Little};
    bool nano{false};
    uint16_t version_major{0};
    uint16_t version_minor{0};
    uint32_t snaplen{0};
    uint32_t network{0};
};

struct PacketHeader {
    uint32_t ts_sec{0};
    uint32_t ts_usec{0};   // nanoseconds when GlobalHeader::nano
    uint32_t incl_len{0};
    uint32_t orig_len{0};
};

// nullopt if the magic is not one of the four pcap magics.
std::optional<GlobalHeader> parse_global_header(std::span<const uint8_t> bytes);

PacketHeader parse_packet_header(std::span<const uint8_t> bytes, utils::ByteOrder order);

// Offset of the UDP payload inside an Ethernet frame, when the frame is
// IPv4/UDP to `dst_port`.
std::optional<std::size_t> udp_payload_offset(std::span<const uint8_t> frame, uint16_t dst_port);

} // namespace csi::rx::pcap
