#pragma once

#include "lp/options.hpp"

namespace lp {

enum class ParseStatus {
    Ok,            // opt is complete
    Help,          // -h/--help: usage already printed
    MissingTarget, // no URL given
    Error,         // diagnostic already printed
};

void print_usage(const char* prog);

ParseStatus parse_args(int argc, char** argv, Options& opt);

} // namespace lp
