#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "lp/stats.hpp"

using namespace lp;
using namespace std::chrono_literals;
using std::chrono::nanoseconds;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_ns(nanoseconds a, nanoseconds b, std::string_view msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b.count()
                  << "ns actual=" << a.count() << "ns" << std::endl;
        std::exit(1);
    }
}

static Measurement ok_m(nanoseconds d, long long size = 0)
{
    return Measurement{200, size, d, {}};
}

static BenchmarkRun finished_run(const std::vector<Measurement>& ms,
                                 nanoseconds wall = 1s)
{
    const auto t0 = BenchmarkRun::Clock::time_point{};
    BenchmarkRun run(t0);
    for (const auto& m : ms) run.record(m);
    run.stop(t0 + wall);
    return run;
}

static void test_uniform_latencies()
{
    BenchmarkRun run = finished_run({ok_m(100ms), ok_m(100ms), ok_m(100ms),
                                     ok_m(100ms), ok_m(100ms)});
    assert_eq_ns(run.average(), 100ms, "uniform: average");
    assert_eq_ns(run.standard_deviation(), 0ns, "uniform: stddev");
    assert_eq_ns(run.median(), 100ms, "uniform: median");
    assert_eq_ns(run.slowest(), 100ms, "uniform: slowest");
    assert_eq_ns(run.fastest(), 100ms, "uniform: fastest");
    assert_eq_ns(run.total_latency(), 500ms, "uniform: total");
}

static void test_even_median_takes_upper_middle()
{
    BenchmarkRun run = finished_run({ok_m(40ms), ok_m(10ms), ok_m(30ms), ok_m(20ms)});
    assert_eq_ns(run.median(), 30ms, "even: median is sorted[2], not mean of 20 and 30");
    assert_eq_ns(run.fastest(), 10ms, "even: fastest");
    assert_eq_ns(run.slowest(), 40ms, "even: slowest");
    assert_eq_ns(run.average(), 25ms, "even: average");
}

static void test_odd_median()
{
    BenchmarkRun run = finished_run({ok_m(9ns), ok_m(1ns), ok_m(5ns)});
    assert_eq_ns(run.median(), 5ns, "odd: median");
}

static void test_median_does_not_reorder_latencies()
{
    BenchmarkRun run = finished_run({ok_m(3ms), ok_m(1ms), ok_m(2ms)});
    (void) run.median();
    const auto& l = run.latencies();
    assert_true(l.size() == 3 && l[0] == 3ms && l[1] == 1ms && l[2] == 2ms,
                "latencies stay in arrival order");
}

static void test_average_is_floored()
{
    BenchmarkRun run = finished_run({ok_m(1ns), ok_m(2ns)});
    assert_eq_ns(run.average(), 1ns, "average floor(3/2) = 1");
    BenchmarkRun run3 = finished_run({ok_m(10ns), ok_m(10ns), ok_m(11ns)});
    assert_eq_ns(run3.average(), 10ns, "average floor(31/3) = 10");
}

static void test_stddev_uses_floored_mean()
{
    // mean floors to 1; deltas 0 and -1 -> variance 0.5 -> sqrt 0.707 -> 0
    BenchmarkRun a = finished_run({ok_m(1ns), ok_m(2ns)});
    assert_eq_ns(a.standard_deviation(), 0ns, "stddev around floored mean");

    // 2,4,4,4,5,5,7,9: mean 5, population variance 4 -> 2
    BenchmarkRun b = finished_run({ok_m(2ns), ok_m(4ns), ok_m(4ns), ok_m(4ns),
                                   ok_m(5ns), ok_m(5ns), ok_m(7ns), ok_m(9ns)});
    assert_eq_ns(b.standard_deviation(), 2ns, "population stddev (not sample)");

    // 10ms,20ms,30ms,40ms: mean 25ms, variance 125ms^2 -> 11.180339887ms
    BenchmarkRun c = finished_run({ok_m(10ms), ok_m(20ms), ok_m(30ms), ok_m(40ms)});
    assert_eq_ns(c.standard_deviation(), 11180339ns, "stddev floored to whole ns");
}

static void test_mixed_status_accounting()
{
    BenchmarkRun run(BenchmarkRun::Clock::time_point{});
    run.record(Measurement{200, 500, 7ms, {}});
    run.record(Measurement{404, 120, 3ms, {}});
    assert_true(run.transferred_bytes() == 620, "bytes from success and failure");
    assert_true(run.successful() == 1, "one success");
    assert_true(run.failed() == 1, "one failure");
    assert_true(run.latencies().size() == 1 && run.latencies()[0] == 7ms,
                "only the 200 latency is kept");
}

static void test_status_classification_bounds()
{
    BenchmarkRun run(BenchmarkRun::Clock::time_point{});
    for (int status : {199, 200, 204, 299, 300, 301, 404, 500, 503})
    {
        run.record(Measurement{status, 1, 1ms, {}});
    }
    assert_true(run.successful() == 3, "200, 204, 299 succeed");
    assert_true(run.failed() == 6, "everything else fails, 3xx included");
    assert_true(run.recorded() == 9, "recorded = success + failure");
    assert_true(run.latencies().size() == static_cast<size_t>(run.successful()),
                "latencies.size == successful");
}

static void test_statistics_are_idempotent()
{
    BenchmarkRun run = finished_run({ok_m(5ms), ok_m(1ms), ok_m(9ms), ok_m(2ms)});
    const auto m1 = run.median();
    const auto a1 = run.average();
    const auto s1 = run.standard_deviation();
    assert_eq_ns(run.median(), m1, "median twice");
    assert_eq_ns(run.average(), a1, "average twice");
    assert_eq_ns(run.standard_deviation(), s1, "stddev twice");
}

static void test_empty_sample_policy()
{
    BenchmarkRun run(BenchmarkRun::Clock::time_point{});
    for (int i = 0; i < 10; ++i) run.record(Measurement{503, 0, 1ms, {}});
    run.stop(BenchmarkRun::Clock::time_point{} + 1s);

    int thrown = 0;
    try { (void) run.average(); } catch (const EmptySampleError&) { ++thrown; }
    try { (void) run.median(); } catch (const EmptySampleError&) { ++thrown; }
    try { (void) run.slowest(); } catch (const EmptySampleError&) { ++thrown; }
    try { (void) run.fastest(); } catch (const EmptySampleError&) { ++thrown; }
    try { (void) run.standard_deviation(); } catch (const EmptySampleError&) { ++thrown; }
    try { (void) run.total_latency(); } catch (const std::domain_error&) { ++thrown; }
    assert_true(thrown == 6, "every latency statistic rejects an empty sample");

    const Summary s = run.summarize();
    assert_true(s.successful == 0 && s.failed == 10, "empty: counts");
    assert_true(!s.slowest && !s.median && !s.fastest && !s.average && !s.stddev,
                "empty: summary latency fields unset");
}

static void test_throughput_and_elapsed()
{
    // 10 * 1024 bytes over 2 s -> 5 KB/s; 3000 bytes over 1 s -> floor(2.93) = 2
    BenchmarkRun a = finished_run({ok_m(1ms, 5 * 1024), ok_m(1ms, 5 * 1024)}, 2s);
    assert_eq_ns(a.elapsed(), 2s, "elapsed = end - start");
    assert_true(a.throughput_kbps() == 5, "throughput 5 KB/s");

    BenchmarkRun b = finished_run({ok_m(1ms, 3000)}, 1s);
    assert_true(b.throughput_kbps() == 2, "throughput floored");
    assert_true(b.summarize().transferred_kb == 2, "transferred kb integer division");

    BenchmarkRun c = finished_run({ok_m(1ms, 4096)}, 0s);
    assert_true(c.throughput_kbps() == 0, "zero elapsed -> 0 throughput");
}

static void test_lifecycle()
{
    const auto t0 = BenchmarkRun::Clock::time_point{};
    BenchmarkRun run(t0);
    run.record(ok_m(1ms));

    bool threw = false;
    try { (void) run.elapsed(); } catch (const std::logic_error&) { threw = true; }
    assert_true(threw, "elapsed before stop throws");

    run.stop(t0 + 3s);
    run.stop(t0 + 9s);
    assert_eq_ns(run.elapsed(), 3s, "end timestamp set once");

    threw = false;
    try { run.record(ok_m(1ms)); } catch (const std::logic_error&) { threw = true; }
    assert_true(threw, "record after stop throws");
    assert_true(run.recorded() == 1, "finalized run unchanged");
}

int main()
{
    test_uniform_latencies();
    test_even_median_takes_upper_middle();
    test_odd_median();
    test_median_does_not_reorder_latencies();
    test_average_is_floored();
    test_stddev_uses_floored_mean();
    test_mixed_status_accounting();
    test_status_classification_bounds();
    test_statistics_are_idempotent();
    test_empty_sample_policy();
    test_throughput_and_elapsed();
    test_lifecycle();
    std::cout << "stats tests: OK" << std::endl;
    return 0;
}
