#include "lp/cli.hpp"

#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace lp {

void print_usage(const char *prog)
{
    std::println("HTTP load generator / latency tool");
    std::println("Usage: {} [options] <url>", prog);
    std::println("Options:");
    std::println(
        "  -c, --concurrency N    Requests kept in flight (default: 5)");
    std::println(
        "  -r, --repetitions N    Total requests to issue (default: 300)");
    std::println(
        "  --timeout MS           Per-request deadline in ms, 0 = none (default: 30000)");
    std::println(
        "  --connect-timeout MS   Connect deadline in ms, 0 = libcurl default (default: 10000)");
    std::println("  --no-follow            Do not follow redirects");
    std::println("  --json                 Output the report in JSON format");
    std::println(
        "  --ndjson               Output each request as a single JSON line, then the report");
    std::println("  -q, --quiet            Do not report failed requests on stderr");
    std::println("  -h, --help             Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} http://localhost:8080/", prog);
    std::println("  {} -c 25 -r 600 http://www.google.com/robots.txt", prog);
}

// Accepts "--name N", "--name=N" and, when `shortname` is given, "-x N".
// Returns false when `a` is not this option. On a match, `ok` reports
// whether a valid integer was found.
static bool int_option(std::string_view a,
                       std::string_view name,
                       std::string_view shortname,
                       int &i,
                       int argc,
                       char **argv,
                       int &out,
                       bool &ok)
{
    std::string val;
    if (a == name || (!shortname.empty() && a == shortname))
    {
        if (i + 1 >= argc)
        {
            std::println("missing value for {}", a);
            ok = false;
            return true;
        }
        val = argv[++i];
    }
    else if (a.size() > name.size() + 1 && a.starts_with(name) &&
             a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
    }
    else
    {
        return false;
    }

    try
    {
        size_t used = 0;
        out = std::stoi(val, &used);
        ok = used == val.size();
    }
    catch (const std::exception &)
    {
        ok = false;
    }
    if (!ok) std::println("invalid value for {}: {}", name, val);
    return true;
}

ParseStatus parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        bool ok = true;
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return ParseStatus::Help;
        }
        if (int_option(a, "--concurrency"sv, "-c"sv, i, argc, argv, opt.concurrency, ok))
        {
            if (!ok) return ParseStatus::Error;
            if (opt.concurrency <= 0) opt.concurrency = 1;
        }
        else if (int_option(a, "--repetitions"sv, "-r"sv, i, argc, argv, opt.repetitions, ok))
        {
            if (!ok) return ParseStatus::Error;
            if (opt.repetitions <= 0) opt.repetitions = 1;
        }
        else if (int_option(a, "--timeout"sv, ""sv, i, argc, argv, opt.timeout_ms, ok))
        {
            if (!ok) return ParseStatus::Error;
            if (opt.timeout_ms < 0) opt.timeout_ms = 0;
        }
        else if (int_option(a, "--connect-timeout"sv, ""sv, i, argc, argv,
                            opt.connect_timeout_ms, ok))
        {
            if (!ok) return ParseStatus::Error;
            if (opt.connect_timeout_ms < 0) opt.connect_timeout_ms = 0;
        }
        else if (a == "--no-follow"sv)
        {
            opt.follow_redirects = false;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "--ndjson"sv)
        {
            opt.ndjson = true;
        }
        else if (a == "-q"sv || a == "--quiet"sv)
        {
            opt.quiet = true;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println("unknown option: {}", a);
            return ParseStatus::Error;
        }
        else if (!opt.url.empty())
        {
            std::println("only one target URL is supported (got {} and {})",
                         opt.url, a);
            return ParseStatus::Error;
        }
        else
        {
            opt.url = std::string(a);
        }
    }
    if (opt.url.empty()) return ParseStatus::MissingTarget;
    return ParseStatus::Ok;
}

} // namespace lp
