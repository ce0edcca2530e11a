#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <vector>

#include <boost/format.hpp>
#include <boost/math/distributions/normal.hpp>

#include "errors.hpp"
#include "logging.hpp"
#include "ranked_list.hpp"

namespace ranksim {

struct kendall_result {
    double tau;
    double pvalue;
};

namespace detail {

struct tie_counts {
    double pairs;    // sum of t (t - 1) / 2 over groups of t tied values
    double triples;  // sum of t (t - 1) (t - 2)
    double weighted; // sum of t (t - 1) (2t + 5)
};

template <typename T>
tie_counts count_rank_ties(std::vector<T> const& v) {
    std::map<T, uint64_t> groups;
    for (auto const& x : v) {
        groups[x] += 1;
    }

    tie_counts ties = {0.0, 0.0, 0.0};
    for (auto const& g : groups) {
        double t = g.second;
        ties.pairs += t * (t - 1) / 2;
        ties.triples += t * (t - 1) * (t - 2);
        ties.weighted += t * (t - 1) * (2 * t + 5);
    }
    return ties;
}

template <typename T>
int sign_of_difference(T const& a, T const& b) {
    return (b < a) - (a < b);
}

}  // namespace detail

/*
    Kendall's tau-b of two paired sequences, adjusted for ties, with the
    two-sided p-value of the asymptotic normal approximation.
    Both values are NaN when fewer than two pairs are given or when one of
    the sequences is constant.
*/
template <typename T>
kendall_result kendall_tau(std::vector<T> const& x, std::vector<T> const& y)
{
    if (x.size() != y.size()) {
        throw invalid_parameter_error(
            (boost::format("paired sequences differ in length: %1% != %2%")
             % x.size() % y.size()).str());
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    kendall_result result = {nan, nan};

    uint64_t n = x.size();
    if (n < 2) {
        RANKSIM_WARN << "kendall tau is undefined for " << n << " pairs";
        return result;
    }

    int64_t con_minus_dis = 0;
    for (uint64_t i = 0; i < n; ++i) {
        for (uint64_t j = i + 1; j < n; ++j) {
            int dx = detail::sign_of_difference(x[i], x[j]);
            int dy = detail::sign_of_difference(y[i], y[j]);
            con_minus_dis += dx * dy;
        }
    }

    auto xt = detail::count_rank_ties(x);
    auto yt = detail::count_rank_ties(y);
    double tot = double(n) * (n - 1) / 2;
    if (xt.pairs == tot || yt.pairs == tot) {
        RANKSIM_WARN << "kendall tau is undefined for a constant sequence";
        return result;
    }

    double tau = con_minus_dis / std::sqrt(tot - xt.pairs) / std::sqrt(tot - yt.pairs);
    result.tau = std::min(1.0, std::max(-1.0, tau));

    double m = double(n) * (n - 1);
    double var = (m * (2.0 * n + 5) - xt.weighted - yt.weighted) / 18
               + (2 * xt.pairs * yt.pairs) / m;
    if (n > 2) {
        var += xt.triples * yt.triples / (9 * m * (n - 2));
    }
    double z = con_minus_dis / std::sqrt(var);

    boost::math::normal_distribution<double> standard_normal;
    result.pvalue = 2 * boost::math::cdf(boost::math::complement(standard_normal, std::fabs(z)));
    return result;
}

struct coverage {
    uint64_t common;
    double percent_s;
    double percent_t;
};

template <typename Item, typename Hash>
typename ranked_list<Item, Hash>::set_type
common_items(ranked_list<Item, Hash> const& S, ranked_list<Item, Hash> const& T)
{
    typename ranked_list<Item, Hash>::set_type in_T(T.begin(), T.end());
    typename ranked_list<Item, Hash>::set_type common;
    for (auto const& item : S) {
        if (in_T.count(item)) common.insert(item);
    }
    return common;
}

template <typename Item, typename Hash>
coverage common_coverage(ranked_list<Item, Hash> const& S,
                         ranked_list<Item, Hash> const& T,
                         uint64_t num_common)
{
    coverage c = {num_common, 0.0, 0.0};
    if (S.size()) c.percent_s = 100.0 * c.common / S.size();
    if (T.size()) c.percent_t = 100.0 * c.common / T.size();
    return c;
}

template <typename Item, typename Hash>
coverage common_coverage(ranked_list<Item, Hash> const& S,
                         ranked_list<Item, Hash> const& T)
{
    return common_coverage(S, T, common_items(S, T).size());
}

/*
    Kendall tau-b of S and T restricted to their common items. Each common
    item is mapped to its rank in either list and the two rank sequences
    are paired by item, so only the relative order of the shared items
    matters. The coverage of the common items is logged and, when
    diagnostics is given, stored there.
*/
template <typename Item, typename Hash>
double kendall(ranked_list<Item, Hash> const& S,
               ranked_list<Item, Hash> const& T,
               coverage* diagnostics = nullptr)
{
    auto common = common_items(S, T);

    auto c = common_coverage(S, T, common.size());
    RANKSIM_LOG << "The number of common elements is " << c.common;
    RANKSIM_LOG << boost::format("The proportion used in list S is %6.3f%%.") % c.percent_s;
    RANKSIM_LOG << boost::format("The proportion used in list T is %6.3f%%.") % c.percent_t;
    if (diagnostics) *diagnostics = c;

    std::vector<uint64_t> S_rank = S.ranks_in(common);
    std::vector<uint64_t> T_rank = T.ranks_in(common);
    return kendall_tau(S_rank, T_rank).tau;
}

}  // namespace ranksim
