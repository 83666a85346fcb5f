#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include "csi/rx/atheros.hpp"
#include "csi/rx/nexmon.hpp"
#include "csi/rx/session.hpp"

namespace csi::rx {

// Community firmware variants of the base capture formats. Each wraps
// the base session and adjusts what it decodes.

// Atheros logs from pull request 10 prepend one byte announcing the byte
// order of the writer: 0xff means big-endian.
class AtherosPull10 {
public:
    static constexpr uint64_t kDataStart = 1;

    AtherosPull10(std::optional<std::filesystem::path> file, const AtherosParams& p = {},
                  SessionOptions opts = {});

    std::size_t read();
    std::size_t seek(const std::filesystem::path& file, uint64_t pos, std::size_t num);
    std::size_t seek(uint64_t pos, std::size_t num);
    uint16_t pmsg(std::span<const uint8_t> data, utils::ByteOrder order = utils::ByteOrder::Little);
    double readstp(utils::ByteOrder order = utils::ByteOrder::Little) { return session_.readstp(order); }

    // Set once the first file byte has been inspected.
    std::optional<utils::ByteOrder> order() const { return order_; }

    Session<AtherosFormat>& session() { return session_; }
    const Session<AtherosFormat>& session() const { return session_; }

private:
    utils::ByteOrder detect(const std::filesystem::path& file);

    Session<AtherosFormat> session_;
    std::optional<utils::ByteOrder> order_;
    bool started_{false};
};

inline constexpr uint16_t NEXMON_PULL46_PMSG_OK = 0xf101;

struct Pull46Fields {
    uint32_t magic;
    int32_t rssi;
    uint8_t fc;
};

// Firmware from pull request 46 packs RSSI and frame control into the
// 32-bit magic word. 0x1111 in the low half marks the rssi/fc pair in
// the high half; otherwise they sit in the low half.
Pull46Fields split_pull46_magic(uint32_t magic);

class NexmonPull46 {
public:
    // Packed-float chips are decoded with autoscale off.
    NexmonPull46(std::optional<std::filesystem::path> file, NexmonParams p = {}, SessionOptions opts = {});

    std::size_t read(utils::ByteOrder order = utils::ByteOrder::Little);
    std::size_t seek(const std::filesystem::path& file, uint64_t pos, std::size_t num,
                     utils::ByteOrder order = utils::ByteOrder::Little);
    std::size_t seek(uint64_t pos, std::size_t num, utils::ByteOrder order = utils::ByteOrder::Little);
    uint16_t pmsg(std::span<const uint8_t> data, utils::ByteOrder order = utils::ByteOrder::Little);

    Session<NexmonFormat>& session() { return session_; }
    const Session<NexmonFormat>& session() const { return session_; }

private:
    void split_written();

    Session<NexmonFormat> session_;
};

} // namespace csi::rx
