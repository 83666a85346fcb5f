#include "csi/utils/endian.hpp"

#include <stdexcept>
#include <string>

namespace csi::utils {

ByteOrder parse_byte_order(const char* name) {
    const std::string s = name ? name : "";
    if (s == "little") return ByteOrder::Little;
    if (s == "big") return ByteOrder::Big;
    throw std::invalid_argument("byte order must be 'little' or 'big', got '" + s + "'");
}

} // namespace csi::utils
