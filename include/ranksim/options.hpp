#pragma once

#include <cstdint>
#include <limits>
#include <string>

#include <boost/lexical_cast.hpp>

#include "errors.hpp"

namespace ranksim {

struct tool_options {
    tool_options()
        : type("int")
        , depth(std::numeric_limits<uint64_t>::max())
        , extrapolate(false)
        , progress(false)
    {}

    std::string type;
    uint64_t depth;
    bool extrapolate;
    bool progress;
};

// Options following the positional arguments argv[1, first). --type is
// accepted by every tool, --depth, --ext and --progress only when
// depth_options is set.
inline tool_options parse_options(int argc, const char* const* argv,
                                  int first, bool depth_options)
{
    tool_options opts;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--type" || (depth_options && arg == "--depth")) {
            if (i + 1 >= argc) {
                throw invalid_parameter_error("Missing value for option " + arg);
            }
            std::string value = argv[++i];
            if (arg == "--type") {
                opts.type = value;
            } else {
                try {
                    opts.depth = boost::lexical_cast<uint64_t>(value);
                } catch (boost::bad_lexical_cast const&) {
                    throw invalid_parameter_error("Invalid depth " + value);
                }
            }
        } else if (depth_options && arg == "--ext") {
            opts.extrapolate = true;
        } else if (depth_options && arg == "--progress") {
            opts.progress = true;
        } else {
            throw invalid_parameter_error("Unknown option " + arg);
        }
    }
    return opts;
}

}  // namespace ranksim
