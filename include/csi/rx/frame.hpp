#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include "csi/status.hpp"
#include "csi/utils/endian.hpp"

namespace csi::rx {

// One framed record handed from the session to a format decoder.
struct Frame {
    std::span<const uint8_t> prefix; // length / type bytes (format::kPrefixSize)
    std::span<const uint8_t> body;
    utils::ByteOrder order{utils::ByteOrder::Little};
    uint64_t offset{0};              // file offset of `prefix`, 0 for datagrams
};

// Body length announced by a record prefix. A `stop` other than Ok ends
// the batch before a body is read: EndOfStream for a terminating prefix,
// TruncatedInput for a corrupt one.
struct BodyLength {
    std::size_t len{0};
    DecodeStatus stop{DecodeStatus::Ok};
};

// Where a decoder writes: `slot` is a zeroed row; `previous` is the most
// recently stored record, if any. `run_previous` is set only when that
// record was decoded by the same read/seek call (or the same run of pmsg
// calls), so sequence gaps are never measured across a re-entry.
struct Target {
    std::size_t slot{0};
    std::optional<std::size_t> previous;
    std::optional<std::size_t> run_previous;
};

} // namespace csi::rx
