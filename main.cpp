// HTTP load generator / latency tool (C++23)

#include <csignal>
#include <exception>
#include <optional>
#include <print>
#include <stdexcept>

#include "lp/cli.hpp"
#include "lp/options.hpp"
#include "lp/output.hpp"
#include "lp/probe.hpp"
#include "lp/stats.hpp"
#include "lp/usecases.hpp"

// Set from the SIGINT handler; probes and the dispatcher poll it.
static lp::Cancellation g_cancel;

extern "C" void on_sigint(int)
{
    g_cancel.cancel();
}

int main(int argc, char **argv)
{
    lp::Options opt;
    if (argc <= 1)
    {
        lp::print_usage(argv[0]);
        return 0;
    }
    switch (lp::parse_args(argc, argv, opt))
    {
        case lp::ParseStatus::Ok:
            break;
        case lp::ParseStatus::Help:
            return 0;
        case lp::ParseStatus::MissingTarget:
            // historical behaviour: usage and a clean exit, no work done
            lp::print_usage(argv[0]);
            return 0;
        case lp::ParseStatus::Error:
            return 1;
    }

    std::optional<lp::CurlGlobal> curl;
    try
    {
        curl.emplace();
    }
    catch (const std::runtime_error &e)
    {
        std::println(stderr, "{}", e.what());
        return 1;
    }

    if (!opt.json && !opt.ndjson)
    {
        std::print("{}", lp::format_header_text(opt));
    }

    auto on_measurement = [&](int seq, const lp::Measurement &m)
    {
        if (opt.ndjson) std::println("{}", lp::build_ndjson_measurement(seq, m));
        if (!opt.quiet && !m.error.empty())
        {
            std::println(stderr, "request {}: {}", seq, m.error);
        }
    };

    std::signal(SIGINT, on_sigint);
    std::optional<lp::BenchmarkRun> run;
    try
    {
        run.emplace(lp::run_benchmark(opt, lp::make_curl_probe(opt),
                                      on_measurement, &g_cancel));
    }
    catch (const std::exception &e)
    {
        std::println(stderr, "benchmark aborted: {}", e.what());
        return 1;
    }
    std::signal(SIGINT, SIG_DFL);

    const lp::Summary s = run->summarize();
    if (opt.json || opt.ndjson)
    {
        std::println("{}", lp::build_report_json(opt, s));
    }
    else
    {
        std::print("{}", lp::format_report_text(s));
    }

    if (s.interrupted)
    {
        std::println(stderr, "interrupted after {} of {} requests",
                     run->recorded(), opt.repetitions);
        return 130;
    }
    if (s.successful == 0)
    {
        std::println(stderr, "no successful requests; latency statistics unavailable");
        return 2;
    }
    return 0;
}
