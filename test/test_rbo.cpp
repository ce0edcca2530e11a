#define BOOST_TEST_MODULE rbo

#include <boost/test/unit_test.hpp>

#include <limits>
#include <string>
#include <vector>

#include "ranksim/rbo.hpp"

using namespace ranksim;

typedef ranked_list<std::string> list_type;

namespace {

std::vector<double> const persistences = {0.1, 0.5, 0.9, 0.98};

list_type const abcdefgh{"a", "b", "c", "d", "e", "f", "g", "h"};
list_type const bxadyczq{"b", "x", "a", "d", "y", "c", "z", "q"};

}

BOOST_AUTO_TEST_CASE(identical_lists)
{
    for (uint64_t k = 1; k <= abcdefgh.size(); ++k) {
        BOOST_CHECK_EQUAL(rbo(abcdefgh, abcdefgh, k, 1.0), 1.0);
        for (auto p : persistences) {
            BOOST_CHECK_CLOSE(rbo(abcdefgh, abcdefgh, k, p, true), 1.0, 1e-9);
        }
    }
}

BOOST_AUTO_TEST_CASE(disjoint_lists)
{
    list_type S{"a", "b", "c", "d"};
    list_type T{"w", "x", "y", "z", "v"};
    for (uint64_t k = 1; k <= 4; ++k) {
        BOOST_CHECK_EQUAL(rbo(S, T, k, 1.0), 0.0);
        for (auto p : persistences) {
            BOOST_CHECK_EQUAL(rbo(S, T, k, p), 0.0);
        }
    }
}

BOOST_AUTO_TEST_CASE(symmetry)
{
    for (uint64_t k = 1; k <= abcdefgh.size(); ++k) {
        BOOST_CHECK_EQUAL(rbo(abcdefgh, bxadyczq, k, 1.0),
                          rbo(bxadyczq, abcdefgh, k, 1.0));
        for (auto p : persistences) {
            BOOST_CHECK_EQUAL(rbo(abcdefgh, bxadyczq, k, p),
                              rbo(bxadyczq, abcdefgh, k, p));
            BOOST_CHECK_EQUAL(rbo(abcdefgh, bxadyczq, k, p, true),
                              rbo(bxadyczq, abcdefgh, k, p, true));
        }
    }
}

BOOST_AUTO_TEST_CASE(reversed_prefix)
{
    // agreements 0, 0, 1/3 at depths 1, 2, 3
    list_type S{"a", "b", "c", "d", "e"};
    list_type T{"e", "d", "c"};
    BOOST_CHECK_CLOSE(rbo(S, T), 1.0 / 9, 1e-10);
    BOOST_CHECK_CLOSE(rbo(S, T, 3, 1.0), 1.0 / 9, 1e-10);
    BOOST_CHECK_EQUAL(rbo(S, T, 2, 1.0), 0.0);
}

BOOST_AUTO_TEST_CASE(average_overlap)
{
    // agreements 0, 1, 2/3, 1
    list_type S{"a", "b", "c", "d"};
    list_type T{"b", "a", "d", "c"};
    BOOST_CHECK_EQUAL(rbo(S, T, 1, 1.0), 0.0);
    BOOST_CHECK_CLOSE(rbo(S, T, 2, 1.0), 0.5, 1e-10);
    BOOST_CHECK_CLOSE(rbo(S, T, 3, 1.0), 5.0 / 9, 1e-10);
    BOOST_CHECK_CLOSE(rbo(S, T, 4, 1.0), 2.0 / 3, 1e-10);

    // extrapolation is not defined without weighting
    BOOST_CHECK_EQUAL(rbo(S, T, 4, 1.0, true), rbo(S, T, 4, 1.0, false));

    for (uint64_t k = 1; k <= abcdefgh.size(); ++k) {
        double ao = rbo(abcdefgh, bxadyczq, k, 1.0);
        BOOST_CHECK_GE(ao, 0.0);
        BOOST_CHECK_LE(ao, 1.0);
    }
}

BOOST_AUTO_TEST_CASE(weighted_overlap)
{
    list_type S{"a", "b", "c", "d"};
    list_type T{"b", "a", "d", "c"};
    // 0.5 * 0 + 0.25 * 1 + 0.125 * 2/3 + 0.0625 * 1
    BOOST_CHECK_CLOSE(rbo(S, T, 4, 0.5), 0.3958333333333333, 1e-10);
    // plus 1 * 0.5^4
    BOOST_CHECK_CLOSE(rbo(S, T, 4, 0.5, true), 0.4583333333333333, 1e-10);

    BOOST_CHECK_CLOSE(rbo(abcdefgh, bxadyczq, unbounded_depth, 0.9), 0.2866899021428571, 1e-9);
    BOOST_CHECK_CLOSE(rbo(abcdefgh, bxadyczq, unbounded_depth, 0.9, true), 0.5019235071428572, 1e-9);
}

BOOST_AUTO_TEST_CASE(depth_is_clamped)
{
    list_type S{"a", "b", "c", "d", "e"};
    list_type T{"e", "d", "c"};
    BOOST_CHECK_EQUAL(rbo(S, T, 100, 0.9), rbo(S, T, 3, 0.9));
    BOOST_CHECK_EQUAL(rbo(S, T, unbounded_depth, 0.9, true), rbo(S, T, 3, 0.9, true));
}

BOOST_AUTO_TEST_CASE(invalid_parameters)
{
    list_type S{"a", "b"};
    list_type T{"b", "a"};
    BOOST_CHECK_THROW(rbo(S, T, 2, 0.0), invalid_parameter_error);
    BOOST_CHECK_THROW(rbo(S, T, 2, -0.5), invalid_parameter_error);
    BOOST_CHECK_THROW(rbo(S, T, 2, 1.5), invalid_parameter_error);
    BOOST_CHECK_THROW(rbo(S, T, 2, std::numeric_limits<double>::quiet_NaN()),
                      invalid_parameter_error);
    BOOST_CHECK_THROW(rbo(S, T, 0, 0.9), invalid_parameter_error);
    BOOST_CHECK_THROW(rbo(S, list_type(), unbounded_depth, 1.0), invalid_parameter_error);
}

BOOST_AUTO_TEST_CASE(progress_does_not_change_results)
{
    progress_printout progress(0, 10);
    double with = rbo(abcdefgh, bxadyczq, unbounded_depth, 0.9, true, &progress);
    double without = rbo(abcdefgh, bxadyczq, unbounded_depth, 0.9, true);
    BOOST_CHECK_EQUAL(with, without);
    BOOST_CHECK_EQUAL(progress.total(), abcdefgh.size());
    BOOST_CHECK_EQUAL(progress.last_reported(), 100U);
}
