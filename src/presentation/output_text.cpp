#include "lp/output.hpp"

#include <iomanip>
#include <sstream>

#include "lp/options.hpp"
#include "lp/stats.hpp"

namespace lp {

std::string format_ms(const std::optional<std::chrono::nanoseconds>& d)
{
    if (!d) return "n/a";
    std::ostringstream os;
    os << std::fixed << std::setprecision(3)
       << std::chrono::duration<double, std::milli>(*d).count();
    return os.str();
}

std::string format_header_text(const Options& opt)
{
    std::ostringstream os;
    os << "Target: " << opt.url << '\n';
    os << "Concurrency: " << opt.concurrency
       << "  Repetitions: " << opt.repetitions
       << "  Timeout: ";
    if (opt.timeout_ms > 0) os << opt.timeout_ms << " ms";
    else os << "none";
    os << "  Redirects: " << (opt.follow_redirects ? "follow" : "off") << '\n';
    return os.str();
}

static std::string latency_line(const char* label,
                                const std::optional<std::chrono::nanoseconds>& d)
{
    std::string line = label;
    line += format_ms(d);
    if (d) line += " ms";
    line += '\n';
    return line;
}

std::string format_report_text(const Summary& s)
{
    std::ostringstream os;
    os << "Successful requests: " << s.successful << '\n';
    os << "Failed requests: " << s.failed << '\n';
    os << "Transferred kilobytes: " << s.transferred_kb << '\n';
    os << "Kilobytes per second: " << s.kb_per_sec << '\n';
    os << "Elapsed wall-clock time: " << std::fixed << std::setprecision(3)
       << std::chrono::duration<double>(s.elapsed).count() << " s\n";
    os << latency_line("Slowest request: ", s.slowest);
    os << latency_line("Median request: ", s.median);
    os << latency_line("Fastest request: ", s.fastest);
    os << latency_line("Average request: ", s.average);
    os << latency_line("Standard deviation: ", s.stddev);
    return os.str();
}

} // namespace lp
