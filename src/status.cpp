#include "csi/status.hpp"

namespace csi {

const char* to_string(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::Ok: return "ok";
        case DecodeStatus::Auxiliary: return "auxiliary";
        case DecodeStatus::UnrecognizedFraming: return "unrecognized framing";
        case DecodeStatus::TruncatedInput: return "truncated input";
        case DecodeStatus::EndOfStream: return "end of stream";
        case DecodeStatus::CapacityReached: return "capacity reached";
    }
    return "unknown";
}

} // namespace csi
