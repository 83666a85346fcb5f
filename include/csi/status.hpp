#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace csi {

// Outcome of decoding one record. The stop reason of a batch is kept in
// ReadReport::stop.
enum class DecodeStatus {
    Ok,                  // record written to the buffer
    Auxiliary,           // metadata-only record, attached to the previous one
    UnrecognizedFraming, // not a CSI record, skipped
    TruncatedInput,      // fewer bytes than declared, or a shape mismatch
    EndOfStream,
    CapacityReached,     // bounded mode is full; not an error
};

const char* to_string(DecodeStatus s);

struct ReadReport {
    std::size_t appended{0};
    std::size_t auxiliary{0};
    std::size_t skipped{0};   // UnrecognizedFraming
    std::size_t malformed{0}; // records rejected with TruncatedInput
    std::size_t dropped{0};   // measurements lost upstream (Intel bfee_count gaps)
    DecodeStatus stop{DecodeStatus::EndOfStream};
};

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnsupportedProfile : public Error {
public:
    using Error::Error;
};

class MissingSidecar : public Error {
public:
    using Error::Error;
};

class TruncatedInputError : public Error {
public:
    using Error::Error;
};

} // namespace csi
