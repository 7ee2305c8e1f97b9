#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <vector>

#include "lp/model.hpp"

namespace lp {

// Raised by latency statistics when no request succeeded.
class EmptySampleError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

struct Summary {
    int       successful{};
    int       failed{};
    long long transferred_bytes{};
    long long transferred_kb{};
    long long kb_per_sec{};
    bool      interrupted{};
    std::chrono::nanoseconds elapsed{};
    // empty when there were no successful requests
    std::optional<std::chrono::nanoseconds> slowest;
    std::optional<std::chrono::nanoseconds> median;
    std::optional<std::chrono::nanoseconds> fastest;
    std::optional<std::chrono::nanoseconds> average;
    std::optional<std::chrono::nanoseconds> stddev;
};

// Running totals of one benchmark. Only the consuming thread may call the
// mutating members (record, stop, mark_interrupted); workers never touch it.
//
// Lifecycle: accumulating until stop(), then finalized. Latency statistics
// are computed over successful requests only and throw EmptySampleError if
// there are none.
class BenchmarkRun {
public:
    using Clock = std::chrono::steady_clock;

    BenchmarkRun();
    explicit BenchmarkRun(Clock::time_point started_at);

    // Throws std::logic_error once finalized.
    void record(const Measurement& m);

    // Sets the end timestamp. Only the first call has an effect.
    void stop();
    void stop(Clock::time_point ended_at);
    bool stopped() const { return ended_at_.has_value(); }

    void mark_interrupted() { interrupted_ = true; }
    bool interrupted() const { return interrupted_; }

    int successful() const { return successful_; }
    int failed() const { return failed_; }
    int recorded() const { return successful_ + failed_; }
    long long transferred_bytes() const { return transferred_bytes_; }
    const std::vector<std::chrono::nanoseconds>& latencies() const { return latencies_; }

    // Requires stop(); throws std::logic_error otherwise.
    std::chrono::nanoseconds elapsed() const;

    std::chrono::nanoseconds total_latency() const;
    // floor(total / count), in whole nanoseconds
    std::chrono::nanoseconds average() const;
    std::chrono::nanoseconds slowest() const;
    std::chrono::nanoseconds fastest() const;
    // Element at index count/2 of the sorted latencies. For an even count
    // this is the upper of the two middle values, not their mean.
    std::chrono::nanoseconds median() const;
    // Population standard deviation around the floored integer average,
    // floored to whole nanoseconds.
    std::chrono::nanoseconds standard_deviation() const;

    // floor(transferred_bytes / 1024 / elapsed seconds); 0 if no time elapsed.
    long long throughput_kbps() const;

    // Never throws on an empty sample; requires stop().
    Summary summarize() const;

private:
    void require_sample() const;

    int       successful_{};
    int       failed_{};
    long long transferred_bytes_{};
    bool      interrupted_{};
    std::vector<std::chrono::nanoseconds> latencies_;
    Clock::time_point started_at_;
    std::optional<Clock::time_point> ended_at_;
};

} // namespace lp
