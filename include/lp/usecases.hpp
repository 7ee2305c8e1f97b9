#pragma once

#include <functional>

#include "lp/concurrency.hpp"
#include "lp/model.hpp"
#include "lp/options.hpp"
#include "lp/probe.hpp"
#include "lp/stats.hpp"

namespace lp {

// Called on the consuming thread for each recorded measurement, in
// completion order. seq is 1-based.
using MeasurementCallback = std::function<void(int /*seq*/, const Measurement&)>;

// Runs the whole benchmark against opt.url and returns the finalized run.
// - Exactly opt.repetitions probes are issued unless `cancel` is set, in
//   which case issuance stops, outstanding probes are drained and the run is
//   marked interrupted.
// - A non-std exception escaping `probe` is rethrown after all workers are
//   idle; an exception from `on_measurement` aborts the run and propagates.
BenchmarkRun run_benchmark(const Options& opt,
                           const ProbeFn& probe,
                           const MeasurementCallback& on_measurement = {},
                           Cancellation* cancel = nullptr);

} // namespace lp
