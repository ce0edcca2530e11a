#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/format.hpp>

#include "errors.hpp"

namespace ranksim {

/*
    An ordered sequence of distinct items: the position of an item is its
    rank, rank 0 being the most relevant. The sequence is validated once,
    at construction, and never changes afterwards.
*/
template <typename Item, typename Hash = std::hash<Item>>
struct ranked_list {
    typedef Item value_type;
    typedef Hash hasher;
    typedef std::unordered_set<Item, Hash> set_type;
    typedef typename std::vector<Item>::const_iterator const_iterator;

    ranked_list() {}

    template <typename Iterator>
    ranked_list(Iterator begin, Iterator end)
        : m_items(begin, end) {
        check_unique();
    }

    ranked_list(std::vector<Item> items)
        : m_items(std::move(items)) {
        check_unique();
    }

    ranked_list(std::initializer_list<Item> items)
        : m_items(items) {
        check_unique();
    }

    size_t size() const {
        return m_items.size();
    }

    bool empty() const {
        return m_items.empty();
    }

    Item const& operator[](size_t rank) const {
        return m_items[rank];
    }

    const_iterator begin() const {
        return m_items.begin();
    }

    const_iterator end() const {
        return m_items.end();
    }

    // ranks of the items that belong to subset, ordered by item so that
    // the sequences derived from two lists pair up element by element
    std::vector<uint64_t> ranks_in(set_type const& subset) const {
        std::vector<std::pair<Item, uint64_t>> found;
        found.reserve(std::min(subset.size(), m_items.size()));
        for (size_t rank = 0; rank < m_items.size(); ++rank) {
            if (subset.count(m_items[rank])) {
                found.emplace_back(m_items[rank], rank);
            }
        }
        std::sort(found.begin(), found.end());

        std::vector<uint64_t> ranks;
        ranks.reserve(found.size());
        for (auto const& f : found) {
            ranks.push_back(f.second);
        }
        return ranks;
    }

private:
    void check_unique() const {
        set_type seen;
        seen.reserve(m_items.size());
        for (size_t rank = 0; rank < m_items.size(); ++rank) {
            if (!seen.insert(m_items[rank]).second) {
                throw duplicate_item_error(
                    (boost::format("duplicate item at rank %1%") % rank).str());
            }
        }
    }

    std::vector<Item> m_items;
};

}  // namespace ranksim
