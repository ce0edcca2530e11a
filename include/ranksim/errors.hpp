#pragma once

#include <stdexcept>
#include <string>

namespace ranksim {

// an input ranking holds the same item at two ranks
struct duplicate_item_error : std::invalid_argument {
    explicit duplicate_item_error(std::string const& what)
        : std::invalid_argument(what) {}
};

// persistence outside (0, 1), empty effective depth, mismatched sequences
struct invalid_parameter_error : std::invalid_argument {
    explicit invalid_parameter_error(std::string const& what)
        : std::invalid_argument(what) {}
};

// input is not of the requested item type
struct type_mismatch_error : std::runtime_error {
    explicit type_mismatch_error(std::string const& what)
        : std::runtime_error(what) {}
};

}  // namespace ranksim
