#include "lp/probe.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

#ifndef LP_VERSION
#define LP_VERSION "0.0.0"
#endif

namespace lp
{
namespace
{
struct Transfer
{
    HeaderTally headers;
    long long body_bytes = 0;
    const std::atomic<bool> *cancel = nullptr;
};

struct EasyDeleter
{
    void operator()(CURL *h) const { curl_easy_cleanup(h); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

std::string_view trim(std::string_view s)
{
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

size_t on_header(char *buf, size_t size, size_t nitems, void *userdata)
{
    auto *t = static_cast<Transfer *>(userdata);
    const size_t n = size * nitems;
    const std::string_view line(buf, n);
    // only the last response's body counts
    if (line.starts_with("HTTP/")) t->body_bytes = 0;
    t->headers.add_line(line);
    return n;
}

size_t on_body(char *, size_t size, size_t nmemb, void *userdata)
{
    auto *t = static_cast<Transfer *>(userdata);
    t->body_bytes += static_cast<long long>(size * nmemb);
    return size * nmemb;
}

int on_progress(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto *t = static_cast<const Transfer *>(clientp);
    return t->cancel->load(std::memory_order_relaxed) ? 1 : 0;
}

template<typename T>
void set_opt(CURL *h, CURLoption o, T v, CURLcode &rc)
{
    if (rc == CURLE_OK) rc = curl_easy_setopt(h, o, v);
}
} // namespace

void HeaderTally::add_line(std::string_view line)
{
    line = trim(line);
    if (line.starts_with("HTTP/"))
    {
        bytes_ = 0;
        status_ = 0;
        complete_ = false;
        has_location_ = false;
        names_.clear();
        const auto sp = line.find(' ');
        if (sp != std::string_view::npos)
        {
            const auto code = line.substr(sp + 1);
            std::from_chars(code.data(), code.data() + code.size(), status_);
        }
        return;
    }
    if (line.empty())
    {
        complete_ = status_ != 0;
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos)
    {
        // obsolete folded continuation of the previous value
        bytes_ += static_cast<long long>(line.size());
        return;
    }
    const auto name = trim(line.substr(0, colon));
    const auto value = trim(line.substr(colon + 1));

    std::string key(name);
    std::ranges::transform(key, key.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    if (key == "location") has_location_ = true;
    if (names_.insert(std::move(key)).second)
    {
        bytes_ += static_cast<long long>(name.size());
    }
    bytes_ += static_cast<long long>(value.size());
}

bool HeaderTally::is_redirect() const
{
    return status_ >= 300 && status_ <= 399 && has_location_;
}

ProbeResult fetch_url_once(const std::string &url,
                           const Options &opt,
                           const std::atomic<bool> &cancel)
{
    ProbeResult out{};
    if (cancel.load(std::memory_order_relaxed))
    {
        out.error = "cancelled";
        return out;
    }

    EasyHandle h(curl_easy_init());
    if (!h)
    {
        out.error = "curl_easy_init failed";
        return out;
    }

    Transfer t{};
    t.cancel = &cancel;
    char errbuf[CURL_ERROR_SIZE]{};

    CURLcode rc = CURLE_OK;
    set_opt(h.get(), CURLOPT_URL, url.c_str(), rc);
    set_opt(h.get(), CURLOPT_HTTPGET, 1L, rc);
    set_opt(h.get(), CURLOPT_NOSIGNAL, 1L, rc);
    set_opt(h.get(), CURLOPT_ERRORBUFFER, errbuf, rc);
    set_opt(h.get(), CURLOPT_USERAGENT, "loadprobe/" LP_VERSION, rc);
    set_opt(h.get(), CURLOPT_HEADERFUNCTION, on_header, rc);
    set_opt(h.get(), CURLOPT_HEADERDATA, &t, rc);
    set_opt(h.get(), CURLOPT_WRITEFUNCTION, on_body, rc);
    set_opt(h.get(), CURLOPT_WRITEDATA, &t, rc);
    set_opt(h.get(), CURLOPT_NOPROGRESS, 0L, rc);
    set_opt(h.get(), CURLOPT_XFERINFOFUNCTION, on_progress, rc);
    set_opt(h.get(), CURLOPT_XFERINFODATA, &t, rc);
    set_opt(h.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(opt.timeout_ms), rc);
    set_opt(h.get(), CURLOPT_CONNECTTIMEOUT_MS,
            static_cast<long>(opt.connect_timeout_ms), rc);
    if (opt.follow_redirects)
    {
        set_opt(h.get(), CURLOPT_FOLLOWLOCATION, 1L, rc);
        set_opt(h.get(), CURLOPT_MAXREDIRS, 10L, rc);
    }
    if (rc != CURLE_OK)
    {
        out.error = std::string("curl setup failed: ") + curl_easy_strerror(rc);
        return out;
    }

    rc = curl_easy_perform(h.get());

    long code = 0;
    if (curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &code) != CURLE_OK)
    {
        code = 0;
    }

    if (rc == CURLE_OK)
    {
        out.status = static_cast<int>(code);
        out.size = t.headers.bytes() + t.body_bytes;
        return out;
    }

    out.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));

    // A response counts only when its header block arrived in full and it
    // was not a redirect still waiting for the next hop.
    const bool final_headers = t.headers.complete() &&
                               !(opt.follow_redirects && t.headers.is_redirect());
    if (rc == CURLE_OPERATION_TIMEDOUT || rc == CURLE_ABORTED_BY_CALLBACK ||
        !final_headers)
    {
        // no usable response: deadline, cancellation, transport error or a
        // failed redirect hop
        out.status = kFailureStatus;
        out.size = 0;
        return out;
    }

    // headers arrived, the body did not
    out.status = t.headers.status();
    out.size = t.headers.bytes();
    return out;
}

ProbeFn make_curl_probe(const Options &opt)
{
    return [opt](const std::string &url, const std::atomic<bool> &cancel)
    {
        return fetch_url_once(url, opt, cancel);
    };
}

CurlGlobal::CurlGlobal()
{
    if (const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
    {
        throw std::runtime_error(std::string("curl_global_init failed: ") +
                                 curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}
} // namespace lp
