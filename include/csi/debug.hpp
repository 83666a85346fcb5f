// Lightweight debug hooks for internal decode steps.
#pragma once
#include <cstdio>
#include <cstdlib>

namespace csi { namespace debug {

// Failure codes recorded by the RX helpers.
enum FailStep : int {
    kFailNone = 0,
    kFailShortPrefix = 1,
    kFailShortBody = 2,
    kFailShape = 3,
    kFailLength = 4,
    kFailFraming = 5,
    kFailPcapHeader = 6,
};

inline thread_local int last_fail_step = 0; // set by RX helpers on failure paths
inline void set_fail(int code) { last_fail_step = code; }

// CSI_TRACE=1 turns on per-record trace output.
inline bool trace_enabled() {
    static const bool on = std::getenv("CSI_TRACE") != nullptr;
    return on;
}

} } // namespace csi::debug

#define CSI_TRACEF(fmt, ...) \
    do { if (csi::debug::trace_enabled()) std::fprintf(stderr, "[TRACE] " fmt "\n", ##__VA_ARGS__); } while (0)
