#include "lp/output.hpp"

#include <iomanip>
#include <sstream>

#include "lp/json.hpp"
#include "lp/model.hpp"
#include "lp/options.hpp"
#include "lp/stats.hpp"

namespace lp
{
static void put_ms(std::ostringstream &os,
                   const std::optional<std::chrono::nanoseconds> &d)
{
    if (d) os << std::chrono::duration<double, std::milli>(*d).count();
    else os << "null";
}

std::string build_ndjson_measurement(int seq, const Measurement &m)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << "\"seq\":" << seq << ",\"status\":" << m.status
            << ",\"size\":" << m.reply_size
            << ",\"ms\":" << std::chrono::duration<double, std::milli>(m.duration).count()
            << ",\"ok\":" << (m.ok() ? "true" : "false");
    if (!m.error.empty())
        os << R"(,"error":")" << json_escape(m.error) << R"(")";
    os << "}";
    return os.str();
}

std::string build_report_json(const Options &opt, const Summary &s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("url":")" << json_escape(opt.url) << R"(",)";
    os << R"("concurrency":)" << opt.concurrency << ",";
    os << R"("repetitions":)" << opt.repetitions << ",";
    os << R"("timeout_ms":)" << opt.timeout_ms << ",";
    os << R"("interrupted":)" << (s.interrupted ? "true" : "false") << ",";
    os << R"("successful":)" << s.successful << ",";
    os << R"("failed":)" << s.failed << ",";
    os << R"("transferred_bytes":)" << s.transferred_bytes << ",";
    os << R"("transferred_kb":)" << s.transferred_kb << ",";
    os << R"("kb_per_sec":)" << s.kb_per_sec << ",";
    os << R"("elapsed_ms":)"
            << std::chrono::duration<double, std::milli>(s.elapsed).count() << ",";
    os << R"("latency_ms":{"slowest":)";
    put_ms(os, s.slowest);
    os << R"(,"median":)";
    put_ms(os, s.median);
    os << R"(,"fastest":)";
    put_ms(os, s.fastest);
    os << R"(,"average":)";
    put_ms(os, s.average);
    os << R"(,"stddev":)";
    put_ms(os, s.stddev);
    os << "}";
    os << "}";
    return os.str();
}
} // namespace lp
