#include "lp/stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace lp {

using std::chrono::nanoseconds;

BenchmarkRun::BenchmarkRun()
    : BenchmarkRun(Clock::now())
{}

BenchmarkRun::BenchmarkRun(Clock::time_point started_at)
    : started_at_(started_at)
{}

void BenchmarkRun::record(const Measurement& m)
{
    if (stopped()) throw std::logic_error("record() on a finalized benchmark run");

    if (m.ok())
    {
        ++successful_;
        latencies_.push_back(m.duration);
    }
    else
    {
        ++failed_;
    }
    transferred_bytes_ += m.reply_size;
}

void BenchmarkRun::stop()
{
    stop(Clock::now());
}

void BenchmarkRun::stop(Clock::time_point ended_at)
{
    if (!ended_at_) ended_at_ = ended_at;
}

nanoseconds BenchmarkRun::elapsed() const
{
    if (!ended_at_) throw std::logic_error("benchmark run not stopped");
    return std::chrono::duration_cast<nanoseconds>(*ended_at_ - started_at_);
}

void BenchmarkRun::require_sample() const
{
    if (latencies_.empty()) throw EmptySampleError("no successful requests");
}

nanoseconds BenchmarkRun::total_latency() const
{
    require_sample();
    return std::accumulate(latencies_.begin(), latencies_.end(), nanoseconds{0});
}

nanoseconds BenchmarkRun::average() const
{
    const auto n = static_cast<nanoseconds::rep>(latencies_.size());
    // integer division of non-negative values == floor
    return nanoseconds{total_latency().count() / n};
}

nanoseconds BenchmarkRun::slowest() const
{
    require_sample();
    return *std::ranges::max_element(latencies_);
}

nanoseconds BenchmarkRun::fastest() const
{
    require_sample();
    return *std::ranges::min_element(latencies_);
}

nanoseconds BenchmarkRun::median() const
{
    require_sample();
    std::vector<nanoseconds> sorted = latencies_;
    std::ranges::sort(sorted);
    return sorted[sorted.size() / 2];
}

nanoseconds BenchmarkRun::standard_deviation() const
{
    const auto mean = average().count();
    double sum_sq = 0.0;
    for (const auto d : latencies_)
    {
        const double delta = static_cast<double>(mean - d.count());
        sum_sq += delta * delta;
    }
    const double variance = sum_sq / static_cast<double>(latencies_.size());
    return nanoseconds{static_cast<nanoseconds::rep>(std::floor(std::sqrt(variance)))};
}

long long BenchmarkRun::throughput_kbps() const
{
    const double secs = std::chrono::duration<double>(elapsed()).count();
    if (secs <= 0.0) return 0;
    return static_cast<long long>(
        std::floor(static_cast<double>(transferred_bytes_) / 1024.0 / secs));
}

Summary BenchmarkRun::summarize() const
{
    Summary s{};
    s.successful        = successful_;
    s.failed            = failed_;
    s.transferred_bytes = transferred_bytes_;
    s.transferred_kb    = transferred_bytes_ / 1024;
    s.kb_per_sec        = throughput_kbps();
    s.elapsed           = elapsed();
    s.interrupted       = interrupted_;
    if (!latencies_.empty())
    {
        s.slowest = slowest();
        s.median  = median();
        s.fastest = fastest();
        s.average = average();
        s.stddev  = standard_deviation();
    }
    return s;
}

} // namespace lp
