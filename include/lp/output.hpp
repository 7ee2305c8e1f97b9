#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lp
{
// Forward declarations to avoid heavy includes in header
struct Options;
struct Measurement;
struct Summary;

// "12.345" (milliseconds, 3 decimals) or "n/a"
std::string format_ms(const std::optional<std::chrono::nanoseconds> &d);

// Text formatting (returns complete text block with trailing newlines)
std::string format_header_text(const Options &opt);

std::string format_report_text(const Summary &s);

// NDJSON line for one recorded measurement (no trailing newline)
std::string build_ndjson_measurement(int seq, const Measurement &m);

// Final JSON report (single object string without trailing newline)
std::string build_report_json(const Options &opt, const Summary &s);
} // namespace lp
