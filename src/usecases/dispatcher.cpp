#include "lp/dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace lp {

Dispatcher::Dispatcher(DispatchConfig cfg,
                       ProbeFn probe,
                       ThreadPool& pool,
                       BoundedQueue<Measurement>& results,
                       const std::atomic<bool>& cancel)
    : cfg_(std::move(cfg)),
      probe_(std::move(probe)),
      pool_(pool),
      results_(results),
      cancel_(cancel)
{
    if (!probe_) throw std::invalid_argument("dispatcher needs a probe");
    if (cfg_.concurrency < 1) cfg_.concurrency = 1;
    if (cfg_.repetitions < 0) cfg_.repetitions = 0;
}

int Dispatcher::start()
{
    const int initial = std::min(cfg_.concurrency, cfg_.repetitions);
    int n = 0;
    while (n < initial && issue_one()) ++n;
    return n;
}

bool Dispatcher::on_measurement_consumed()
{
    if (exhausted()) return false;
    return issue_one();
}

bool Dispatcher::issue_one()
{
    if (cancel_.load(std::memory_order_relaxed)) return false;
    if (!pool_.submit([this] { run_probe(); }))
    {
        throw std::logic_error("thread pool rejected a probe task");
    }
    ++issued_;
    return true;
}

void Dispatcher::run_probe()
{
    const int now_in_flight = in_flight_.fetch_add(1) + 1;
    int peak = peak_in_flight_.load();
    while (now_in_flight > peak &&
           !peak_in_flight_.compare_exchange_weak(peak, now_in_flight))
    {}

    const auto t0 = std::chrono::steady_clock::now();
    ProbeResult r;
    std::exception_ptr foreign;
    try
    {
        r = probe_(cfg_.url, cancel_);
    }
    catch (const std::exception& e)
    {
        r = ProbeResult{kFailureStatus, 0, e.what()};
    }
    catch (...)
    {
        // still counts as a failed request; rethrown below for the pool
        r = ProbeResult{kFailureStatus, 0, "unknown exception from probe"};
        foreign = std::current_exception();
    }
    const auto t1 = std::chrono::steady_clock::now();

    // leave the in-flight set before the consumer can see the result, so a
    // replacement never overlaps this task
    in_flight_.fetch_sub(1);
    const bool delivered = results_.push(
        Measurement{r.status, r.size,
                    std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0),
                    std::move(r.error)});
    if (foreign) std::rethrow_exception(foreign);
    if (!delivered) throw std::runtime_error("result queue closed, measurement dropped");
}

} // namespace lp
