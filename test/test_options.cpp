#define BOOST_TEST_MODULE options

#include <boost/test/unit_test.hpp>

#include <limits>

#include "ranksim/options.hpp"

using namespace ranksim;

BOOST_AUTO_TEST_CASE(defaults)
{
    const char* argv[] = {"rbo", "a.txt", "b.txt"};
    auto opts = parse_options(3, argv, 3, true);
    BOOST_CHECK_EQUAL(opts.type, "int");
    BOOST_CHECK_EQUAL(opts.depth, std::numeric_limits<uint64_t>::max());
    BOOST_CHECK(!opts.extrapolate);
    BOOST_CHECK(!opts.progress);
}

BOOST_AUTO_TEST_CASE(depth_options)
{
    const char* argv[] = {"rbo", "a.txt", "b.txt", "--ext", "--depth", "10",
                          "--type", "str", "--progress"};
    auto opts = parse_options(9, argv, 3, true);
    BOOST_CHECK_EQUAL(opts.type, "str");
    BOOST_CHECK_EQUAL(opts.depth, 10U);
    BOOST_CHECK(opts.extrapolate);
    BOOST_CHECK(opts.progress);
}

BOOST_AUTO_TEST_CASE(type_only_tools)
{
    const char* type[] = {"kendall", "a.txt", "b.txt", "--type", "str"};
    BOOST_CHECK_EQUAL(parse_options(5, type, 3, false).type, "str");

    const char* depth[] = {"kendall", "a.txt", "b.txt", "--depth", "3"};
    BOOST_CHECK_THROW(parse_options(5, depth, 3, false), invalid_parameter_error);

    const char* ext[] = {"kendall", "a.txt", "b.txt", "--ext"};
    BOOST_CHECK_THROW(parse_options(4, ext, 3, false), invalid_parameter_error);
}

BOOST_AUTO_TEST_CASE(malformed_options)
{
    const char* unknown[] = {"kendall", "a.txt", "b.txt", "--verbose"};
    BOOST_CHECK_THROW(parse_options(4, unknown, 3, false), invalid_parameter_error);
    BOOST_CHECK_THROW(parse_options(4, unknown, 3, true), invalid_parameter_error);

    const char* missing[] = {"kendall", "a.txt", "b.txt", "--type"};
    BOOST_CHECK_THROW(parse_options(4, missing, 3, false), invalid_parameter_error);

    const char* bad_depth[] = {"rbo", "a.txt", "b.txt", "--depth", "ten"};
    BOOST_CHECK_THROW(parse_options(5, bad_depth, 3, true), invalid_parameter_error);
}
