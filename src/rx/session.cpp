#include "csi/rx/session.hpp"

#include <iterator>

namespace csi::rx {

std::vector<double> read_sidecar(const std::filesystem::path& path, utils::ByteOrder order) {
    if (!std::filesystem::exists(path)) throw MissingSidecar("sidecar not found: " + path.string());
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw MissingSidecar("failed to open sidecar: " + path.string());
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    const std::size_t n = bytes.size() / SIDECAR_ENTRY_LEN;
    if (n == 0) throw TruncatedInputError("sidecar holds no complete entry: " + path.string());

    std::vector<double> stp(n);
    for (std::size_t i = 0; i < n; ++i) {
        const uint8_t* p = bytes.data() + i * SIDECAR_ENTRY_LEN;
        const uint32_t sec = utils::load_u32(p, order);
        const uint32_t usec = utils::load_u32(p + 4, order);
        stp[i] = double(sec) + double(usec) * 1e-6;
    }
    return stp;
}

} // namespace csi::rx
