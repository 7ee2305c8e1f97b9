#pragma once

#include <string>

namespace lp
{
struct Options
{
    std::string url;
    int concurrency = 5;           // probes kept in flight
    int repetitions = 300;         // total probes to issue
    int timeout_ms = 30000;        // per-probe deadline, 0 = none
    int connect_timeout_ms = 10000; // 0 = libcurl default
    bool follow_redirects = true;
    bool json = false;             // final report as JSON
    bool ndjson = false;           // one JSON line per measurement
    bool quiet = false;            // no per-failure diagnostics
};
} // namespace lp
