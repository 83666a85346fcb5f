#include "csi/rx/variants.hpp"

#include <algorithm>
#include <fstream>
#include <string>

namespace csi::rx {

using utils::ByteOrder;

AtherosPull10::AtherosPull10(std::optional<std::filesystem::path> file, const AtherosParams& p,
                             SessionOptions opts)
    : session_(std::move(file), AtherosFormat(p), opts) {}

ByteOrder AtherosPull10::detect(const std::filesystem::path& file) {
    if (order_) return *order_;
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) throw Error("atheros: failed to open " + file.string());
    char marker = 0;
    if (!in.get(marker)) throw Error("atheros: empty capture " + file.string());
    order_ = static_cast<uint8_t>(marker) == 0xff ? ByteOrder::Big : ByteOrder::Little;
    CSI_TRACEF("atheros pull10: %s-endian writer", *order_ == ByteOrder::Big ? "big" : "little");
    return *order_;
}

std::size_t AtherosPull10::read() {
    if (!session_.file()) throw Error("atheros: read() needs a capture file");
    const auto file = *session_.file();
    const ByteOrder order = detect(file);
    if (!started_) {
        started_ = true;
        return session_.seek(file, kDataStart, 0, order);
    }
    return session_.read(order);
}

std::size_t AtherosPull10::seek(const std::filesystem::path& file, uint64_t pos, std::size_t num) {
    const ByteOrder order = detect(file);
    started_ = true;
    return session_.seek(file, std::max(pos, kDataStart), num, order);
}

std::size_t AtherosPull10::seek(uint64_t pos, std::size_t num) {
    if (!session_.file()) throw Error("atheros: seek() needs a capture file");
    const auto file = *session_.file();
    return seek(file, pos, num);
}

uint16_t AtherosPull10::pmsg(std::span<const uint8_t> data, ByteOrder order) {
    return session_.pmsg(data, order);
}

Pull46Fields split_pull46_magic(uint32_t magic) {
    if ((magic & 0xffff) == 0x1111)
        return {magic & 0xffff, int32_t(int8_t((magic >> 16) & 0xff)), uint8_t(magic >> 24)};
    return {magic >> 16, int32_t(int8_t((magic >> 8) & 0xff)), uint8_t(magic & 0xff)};
}

namespace {

NexmonParams without_autoscale(NexmonParams p) {
    p.autoscale = false;
    return p;
}

} // namespace

NexmonPull46::NexmonPull46(std::optional<std::filesystem::path> file, NexmonParams p, SessionOptions opts)
    : session_(std::move(file), NexmonFormat(without_autoscale(p)), opts) {}

void NexmonPull46::split_written() {
    auto& r = session_.records();
    const auto [first, last] = session_.last_written();
    for (std::size_t i = first; i < last; ++i) {
        const auto f = split_pull46_magic(r.magic[i]);
        r.magic[i] = f.magic;
        r.rssi[i] = f.rssi;
        r.fc[i] = f.fc;
    }
}

std::size_t NexmonPull46::read(ByteOrder order) {
    const std::size_t n = session_.read(order);
    split_written();
    return n;
}

std::size_t NexmonPull46::seek(const std::filesystem::path& file, uint64_t pos, std::size_t num, ByteOrder order) {
    const std::size_t n = session_.seek(file, pos, num, order);
    split_written();
    return n;
}

std::size_t NexmonPull46::seek(uint64_t pos, std::size_t num, ByteOrder order) {
    const std::size_t n = session_.seek(pos, num, order);
    split_written();
    return n;
}

uint16_t NexmonPull46::pmsg(std::span<const uint8_t> data, ByteOrder order) {
    if (session_.pmsg(data, order) == 0) return 0;
    split_written();
    return NEXMON_PULL46_PMSG_OK;
}

} // namespace csi::rx
