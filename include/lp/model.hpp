#pragma once

#include <chrono>
#include <string>

namespace lp {

// Status reported for a probe that produced no usable HTTP response
// (transport error, deadline, cancellation).
inline constexpr int kFailureStatus = 500;

struct ProbeResult {
    int         status{kFailureStatus};
    long long   size{};
    std::string error;      // empty on full success
};

// Outcome of one probe, handed from a worker to the consumer by value.
struct Measurement {
    int                      status{};
    long long                reply_size{};
    std::chrono::nanoseconds duration{};
    std::string              error;

    bool ok() const { return status >= 200 && status <= 299; }
};

} // namespace lp
