#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>

#include "lp/model.hpp"
#include "lp/options.hpp"

namespace lp
{
// One GET against url. Must not throw; failures are reported through
// ProbeResult (status 500 and size 0 when no response was obtained).
using ProbeFn = std::function<ProbeResult(const std::string & /*url*/,
                                          const std::atomic<bool> & /*cancel*/)>;

// Header block of one response, fed line by line as libcurl delivers it.
// The reply-size contribution is the sum over distinct header names
// (case-insensitive) of the name length plus the length of every value:
// a repeated header such as Set-Cookie counts its name once.
class HeaderTally
{
public:
    // A status line ("HTTP/...") starts a new response and discards the
    // previous one (redirect hop, 100 Continue). The blank line ends it.
    void add_line(std::string_view line);

    long long bytes() const { return bytes_; }
    int status() const { return status_; }
    bool complete() const { return complete_; }
    // 3xx carrying a Location header
    bool is_redirect() const;

private:
    long long bytes_ = 0;
    int status_ = 0;
    bool complete_ = false;
    bool has_location_ = false;
    std::unordered_set<std::string> names_;
};

// libcurl based probe. Honors opt.timeout_ms, opt.connect_timeout_ms and
// opt.follow_redirects; aborts early when cancel becomes true.
ProbeResult fetch_url_once(const std::string &url,
                           const Options &opt,
                           const std::atomic<bool> &cancel);

// Binds fetch_url_once to a copy of opt.
ProbeFn make_curl_probe(const Options &opt);

// Process-wide libcurl initialisation for the lifetime of the object.
// Throws std::runtime_error if curl_global_init fails.
class CurlGlobal
{
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal &) = delete;
    CurlGlobal &operator=(const CurlGlobal &) = delete;
};
} // namespace lp
