#pragma once

#include <atomic>
#include <string>

#include "lp/bounded_queue.hpp"
#include "lp/concurrency.hpp"
#include "lp/model.hpp"
#include "lp/probe.hpp"

namespace lp {

struct DispatchConfig {
    std::string url;
    int         concurrency{1};
    int         repetitions{1};
};

// Closed-workload issuer: keeps `concurrency` probes outstanding until
// `repetitions` probes have been issued. A replacement is issued only after
// the consumer has taken a measurement off the queue, which bounds the
// number of probes in flight.
//
// start() and on_measurement_consumed() belong to the consuming thread.
// Probe tasks only touch the result queue and the in-flight counters.
// The pool and the queue must outlive every task issued here.
class Dispatcher {
public:
    Dispatcher(DispatchConfig cfg,
               ProbeFn probe,
               ThreadPool& pool,
               BoundedQueue<Measurement>& results,
               const std::atomic<bool>& cancel);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Issues min(concurrency, repetitions) probes; returns how many.
    int start();

    // Issues one replacement probe unless the budget is spent or the run
    // was cancelled. Returns true if a probe was issued.
    bool on_measurement_consumed();

    int requests_issued() const { return issued_; }
    bool exhausted() const { return issued_ >= cfg_.repetitions; }
    const DispatchConfig& config() const { return cfg_; }

    // Probes currently executing, and the highest value seen so far.
    int in_flight() const { return in_flight_.load(); }
    int peak_in_flight() const { return peak_in_flight_.load(); }

private:
    bool issue_one();
    void run_probe();

    DispatchConfig cfg_;
    ProbeFn probe_;
    ThreadPool& pool_;
    BoundedQueue<Measurement>& results_;
    const std::atomic<bool>& cancel_;
    int issued_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_in_flight_{0};
};

} // namespace lp
