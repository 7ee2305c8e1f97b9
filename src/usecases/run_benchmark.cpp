#include "lp/usecases.hpp"

#include <algorithm>
#include <exception>

#include "lp/bounded_queue.hpp"
#include "lp/dispatcher.hpp"

namespace lp {

BenchmarkRun run_benchmark(const Options& opt,
                           const ProbeFn& probe,
                           const MeasurementCallback& on_measurement,
                           Cancellation* cancel)
{
    Cancellation local_cancel;
    Cancellation& cancellation = cancel ? *cancel : local_cancel;

    const int concurrency = std::max(1, opt.concurrency);
    const int repetitions = std::max(1, opt.repetitions);

    // capacity == concurrency: with at most `concurrency` probes outstanding
    // a producer never waits on a full queue
    BoundedQueue<Measurement> results(static_cast<std::size_t>(concurrency));
    ThreadPool pool(std::min(concurrency, repetitions));
    Dispatcher dispatcher(DispatchConfig{opt.url, concurrency, repetitions},
                          probe, pool, results, cancellation.flag());

    BenchmarkRun run;
    try
    {
        dispatcher.start();
        int seq = 0;
        while (run.recorded() < dispatcher.requests_issued())
        {
            auto m = results.pop();
            if (!m) break;
            run.record(*m);
            ++seq;
            if (on_measurement) on_measurement(seq, *m);
            dispatcher.on_measurement_consumed();
        }
    }
    catch (...)
    {
        // unblock and drain the workers before the dispatcher goes away
        cancellation.cancel();
        results.close();
        pool.wait_idle();
        throw;
    }

    if (run.recorded() < repetitions) run.mark_interrupted();
    run.stop();
    pool.wait_idle();
    if (auto ep = pool.first_exception()) std::rethrow_exception(ep);
    return run;
}

} // namespace lp
