#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include "ranksim/configuration.hpp"
#include "ranksim/io.hpp"
#include "ranksim/logging.hpp"
#include "ranksim/options.hpp"
#include "ranksim/progress.hpp"
#include "ranksim/rbo.hpp"
#include "ranksim/util.hpp"

using namespace ranksim;

template <typename Item>
void compute(std::string const& filename_A, std::string const& filename_B,
             tool_options const& opts)
{
    uint64_t k = opts.depth;
    bool ext = opts.extrapolate;
    ranked_list<Item> A(read_ranking_file<Item>(filename_A));
    ranked_list<Item> B(read_ranking_file<Item>(filename_B));
    logger() << "Comparing rankings of " << A.size() << " and " << B.size()
             << " items" << std::endl;

    auto const& conf = configuration::get();
    progress_printout progress(0, conf.progress_delta);
    progress_printout* plog = opts.progress ? &progress : nullptr;

    boost::format rbofmt("\t rbo(p = %1$.5f) = %2$.6f, ext = %3$.6f, "
                         "bounds = %4$.6f + %5$.6f (n=%6$7d, d=%7$7d)");
    auto P = {0.7, 0.8, 0.9, 0.95, 0.99, 0.999, 0.9999, 0.99999};
    for (auto p : P) {
        double tick = get_time_usecs();
        double user_tick = get_user_time_usecs();
        double fixed = rbo(A, B, k, p, ext, plog);
        double full = rbo_ext(A, B, p, plog);
        auto bounds = rbo_bounds(A, B, p, plog);
        double elapsed_usecs = get_time_usecs() - tick;
        double user_elapsed_usecs = get_user_time_usecs() - user_tick;

        logger() << rbofmt % p % fixed % full % bounds.min % bounds.residual
                        % bounds.depth % bounds.evaluated_depth
                 << std::endl;
        stats_line()
            ("p", p)
            ("depth", std::min<uint64_t>(k, bounds.depth))
            ("extrapolated", ext)
            ("rbo", fixed)
            ("rbo_ext", full)
            ("rbo_min", bounds.min)
            ("rbo_res", bounds.residual)
            ("time_usecs", elapsed_usecs)
            ("user_time_usecs", user_elapsed_usecs)
            ;
    }

    // extrapolated at the configured persistence (RANKSIM_PERSISTENCE)
    double configured = rbo_ext(A, B, conf.persistence, plog);
    logger() << boost::format("\t rbo_ext(p = %1$.5f) = %2$.6f") % conf.persistence % configured
             << std::endl;
    stats_line()
        ("p", conf.persistence)
        ("configured", true)
        ("rbo_ext", configured)
        ;

    double average_overlap = rbo(A, B, k, 1.0, false, plog);
    logger() << boost::format("\t average overlap = %1$.6f") % average_overlap
             << std::endl;
    stats_line()
        ("p", 1.0)
        ("rbo", average_overlap)
        ;
}

int main(int argc, char** argv)
{
    if (argc < 3) {
        std::cerr << "Usage " << argv[0] << ":\n"
                  << "\t<filename1> <filename2> [--type int|str] [--depth k] [--ext] [--progress]"
                  << std::endl;
        std::cerr << "The files should contain one item per line." << std::endl;
        return 1;
    }

    std::string filename_A = argv[1];
    std::string filename_B = argv[2];

    try {
        tool_options opts = parse_options(argc, argv, 3, true);

        init_logging();
        if (!configuration::get().log_file.empty()) {
            start_logging_to_file(configuration::get().log_file);
        }

        switch (parse_item_type(opts.type)) {
        case item_type::integer:
            compute<int64_t>(filename_A, filename_B, opts);
            break;
        case item_type::string:
            compute<std::string>(filename_A, filename_B, opts);
            break;
        }
    } catch (std::exception const& e) {
        logger() << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
