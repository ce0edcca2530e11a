#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <boost/format.hpp>

#include "configuration.hpp"
#include "errors.hpp"
#include "progress.hpp"
#include "ranked_list.hpp"

namespace ranksim {

static const uint64_t unbounded_depth = std::numeric_limits<uint64_t>::max();

namespace detail {

inline void check_persistence(double p) {
    if (!(p > 0.0 && p < 1.0)) {
        throw invalid_parameter_error(
            (boost::format("persistence must lie in (0, 1), got %1%") % p).str());
    }
}

inline void check_depth(uint64_t depth) {
    if (depth == 0) {
        throw invalid_parameter_error("evaluation depth is zero: both rankings must be non-empty");
    }
}

}  // namespace detail

/*
    Rank-biased overlap of S and T evaluated down to depth
    k' = min(|S|, |T|, k).

    With p = 1 there is no weighting and the result is the average
    overlap of the two prefixes. Otherwise the agreement at depth d is
    weighted by (1 - p) * p^d; when extrapolate is set the agreement
    measured at depth k' is assumed to hold for the rest of the (infinite)
    rankings, which adds A[k' - 1] * p^k'.
*/
template <typename Item, typename Hash>
double rbo(ranked_list<Item, Hash> const& S, ranked_list<Item, Hash> const& T,
           uint64_t k = unbounded_depth, double p = 1.0,
           bool extrapolate = false, progress_printout* progress = nullptr)
{
    typedef typename ranked_list<Item, Hash>::set_type set_type;

    bool weighted = p != 1.0;
    if (weighted) {
        detail::check_persistence(p);
    }
    k = std::min<uint64_t>(k, std::min(S.size(), T.size()));
    detail::check_depth(k);

    std::vector<double> weights(k, 1.0);
    if (weighted) {
        double w = 1.0 - p;
        for (auto& weight : weights) {
            weight = w;
            w *= p;
        }
    }

    std::vector<double> A(k, 0.0);   // agreement
    std::vector<double> AO(k, 0.0);  // (weighted) average overlap

    set_type S_running, T_running;
    S_running.insert(S[0]);
    T_running.insert(T[0]);
    A[0] = S[0] == T[0] ? 1.0 : 0.0;
    AO[0] = weights[0] * A[0];

    if (progress) progress->restart(k);
    for (uint64_t d = 1; d < k; ++d) {
        if (progress) progress->printout(d);

        // membership is tested before the items at depth d are added:
        // when S[d] == T[d] neither can be in the other running set yet
        uint64_t inc = 0;
        if (T_running.count(S[d])) ++inc;
        if (S_running.count(T[d])) ++inc;
        if (S[d] == T[d]) ++inc;

        A[d] = (A[d - 1] * d + inc) / (d + 1);
        if (weighted) {
            AO[d] = AO[d - 1] + weights[d] * A[d];
        } else {
            AO[d] = (AO[d - 1] * d + A[d]) / (d + 1);
        }

        S_running.insert(S[d]);
        T_running.insert(T[d]);
    }

    if (extrapolate && weighted) {
        return AO[k - 1] + A[k - 1] * std::pow(p, double(k));
    }
    return AO[k - 1];
}

/*
    Extrapolated rank-biased overlap of two rankings of possibly different
    length (Webber et al., Eq. 32).

    The longer ranking is scanned to its end. Past the end of the shorter
    one, the overlap it has settled on is spread over the remaining depths
    (the disjoint term) and the unseen tail is extrapolated geometrically.
    The first argument plays the short role unless it is strictly longer.
    p defaults to the configured persistence (RANKSIM_PERSISTENCE, 0.98).
*/
template <typename Item, typename Hash>
double rbo_ext(ranked_list<Item, Hash> const& first,
               ranked_list<Item, Hash> const& second,
               double p = configuration::get().persistence,
               progress_printout* progress = nullptr)
{
    typedef typename ranked_list<Item, Hash>::set_type set_type;

    detail::check_persistence(p);
    bool first_is_long = first.size() > second.size();
    auto const& S = first_is_long ? second : first;
    auto const& L = first_is_long ? first : second;
    uint64_t s = S.size();
    uint64_t l = L.size();
    detail::check_depth(s);

    std::vector<uint64_t> X(l, 0);  // overlap
    std::vector<double> A(l, 0.0);  // agreement
    std::vector<double> R(l, 0.0);  // rbo down to depth d

    set_type S_running, L_running;
    S_running.insert(S[0]);
    L_running.insert(L[0]);
    X[0] = S[0] == L[0] ? 1 : 0;
    A[0] = X[0];
    R[0] = (1.0 - p) * A[0];

    double disjoint = 0.0;
    double ext_term = A[0] * p;
    double weight = (1.0 - p) * p;  // (1 - p) * p^d

    if (progress) progress->restart(l);
    for (uint64_t d = 1; d < l; ++d, weight *= p) {
        if (progress) progress->printout(d);

        if (d < s) {
            uint64_t overlap_incr = 0;
            if (S[d] == L[d]) {
                overlap_incr = 1;
            } else {
                overlap_incr += L_running.count(S[d]);
                overlap_incr += S_running.count(L[d]);
            }
            S_running.insert(S[d]);
            L_running.insert(L[d]);

            X[d] = X[d - 1] + overlap_incr;
            A[d] = 2.0 * X[d] / (S_running.size() + L_running.size());
            R[d] = R[d - 1] + weight * A[d];
            ext_term = A[d] * std::pow(p, double(d + 1));
        } else {
            // S is exhausted, only L keeps contributing new items
            uint64_t overlap_incr = S_running.count(L[d]);
            L_running.insert(L[d]);

            X[d] = X[d - 1] + overlap_incr;
            A[d] = double(X[d]) / (d + 1);
            R[d] = R[d - 1] + weight * A[d];

            double X_s = X[s - 1];
            disjoint += weight * (X_s * (d + 1 - s) / ((d + 1) * double(s)));
            ext_term = (double(X[d] - X[s - 1]) / (d + 1) + X_s / s) *
                       std::pow(p, double(d + 1));
        }
    }

    return R[l - 1] + disjoint + ext_term;
}

struct rbo_bounds_result {
    double min;
    double residual;
    uint64_t depth;            // common depth of the two prefixes
    uint64_t evaluated_depth;  // depth reached expanding the tail

    double max() const {
        return min + residual;
    }
};

/*
    Lower bound and residual of the rank-biased overlap of the prefixes of
    common length n = min(|S|, |T|). Both series are expanded past n until
    the weight drops below epsilon: the lower one assumes that no further
    item is shared, the upper one that every further item is.
*/
template <typename Item, typename Hash>
rbo_bounds_result rbo_bounds(ranked_list<Item, Hash> const& S,
                             ranked_list<Item, Hash> const& T, double p,
                             progress_printout* progress = nullptr,
                             double epsilon = configuration::get().bounds_epsilon)
{
    typedef typename ranked_list<Item, Hash>::set_type set_type;

    detail::check_persistence(p);
    uint64_t n = std::min(S.size(), T.size());
    detail::check_depth(n);
    if (!(epsilon > 0.0)) {
        throw invalid_parameter_error(
            (boost::format("tail epsilon must be positive, got %1%") % epsilon).str());
    }

    double weight = 1.0 - p;
    double rbo_min = 0.0;
    uint64_t overlap = 0;

    set_type seen_S;
    set_type seen_T;

    if (progress) progress->restart(n);
    uint64_t i = 1;
    for (; i <= n; ++i) {
        if (progress) progress->printout(i - 1);

        if (S[i - 1] == T[i - 1]) {
            overlap++;
        } else {
            overlap += seen_T.count(S[i - 1]);
            overlap += seen_S.count(T[i - 1]);
        }
        seen_S.insert(S[i - 1]);
        seen_T.insert(T[i - 1]);
        rbo_min += weight * overlap / i;
        weight *= p;
    }

    uint64_t max_overlap = overlap;
    double rbo_max = rbo_min;
    for (; weight > epsilon; ++i) {
        rbo_min += weight * overlap / i;
        if (max_overlap == i - 1) {
            // both new elements must be the same novel one
            max_overlap += 1;
        } else {
            // two new elements can be assumed, both ones that
            // appeared already in the other list
            max_overlap += 2;
        }
        rbo_max += weight * max_overlap / i;
        // prepare for the next pair of imaginary values
        weight *= p;
    }

    rbo_bounds_result result;
    result.min = rbo_min;
    result.residual = rbo_max - rbo_min;
    result.depth = n;
    result.evaluated_depth = i - 1;
    return result;
}

}  // namespace ranksim
