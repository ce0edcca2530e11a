#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "errors.hpp"

namespace ranksim {

enum class item_type { integer, string };

inline item_type parse_item_type(std::string const& name) {
    if (name == "int") return item_type::integer;
    if (name == "str") return item_type::string;
    throw type_mismatch_error("unsupported item type '" + name +
                              "' (expected int or str)");
}

// one item per line, blank lines are skipped
template <typename Item>
std::vector<Item> read_ranking(std::istream& is) {
    std::vector<Item> items;
    std::string line;
    uint64_t line_no = 0;
    while (std::getline(is, line)) {
        ++line_no;
        boost::algorithm::trim(line);
        if (line.empty()) continue;
        try {
            items.push_back(boost::lexical_cast<Item>(line));
        } catch (boost::bad_lexical_cast const&) {
            throw type_mismatch_error(
                (boost::format("line %1%: cannot convert '%2%' to the requested item type")
                 % line_no % line).str());
        }
    }
    return items;
}

template <typename Item>
std::vector<Item> read_ranking_file(std::string const& filename) {
    std::ifstream in(filename.c_str());
    if (!in.is_open()) {
        throw std::runtime_error("Error opening ranking file " + filename);
    }
    return read_ranking<Item>(in);
}

}  // namespace ranksim
