#include <iostream>
#include <string>

#include <boost/format.hpp>

#include "ranksim/configuration.hpp"
#include "ranksim/io.hpp"
#include "ranksim/kendall.hpp"
#include "ranksim/logging.hpp"
#include "ranksim/options.hpp"
#include "ranksim/util.hpp"

using namespace ranksim;

template <typename Item>
void compute(std::string const& filename_A, std::string const& filename_B)
{
    ranked_list<Item> A(read_ranking_file<Item>(filename_A));
    ranked_list<Item> B(read_ranking_file<Item>(filename_B));

    coverage c = {0, 0.0, 0.0};
    double tau = kendall(A, B, &c);
    logger() << boost::format("\t tau-b = %1$.6f") % tau << std::endl;
    stats_line()
        ("common", c.common)
        ("coverage_s", c.percent_s)
        ("coverage_t", c.percent_t)
        ("tau", tau)
        ;
}

int main(int argc, char** argv)
{
    if (argc < 3) {
        std::cerr << "Usage " << argv[0] << ":\n"
                  << "\t<filename1> <filename2> [--type int|str]" << std::endl;
        return 1;
    }

    std::string filename_A = argv[1];
    std::string filename_B = argv[2];

    try {
        tool_options opts = parse_options(argc, argv, 3, false);

        init_logging();
        if (!configuration::get().log_file.empty()) {
            start_logging_to_file(configuration::get().log_file);
        }

        switch (parse_item_type(opts.type)) {
        case item_type::integer:
            compute<int64_t>(filename_A, filename_B);
            break;
        case item_type::string:
            compute<std::string>(filename_A, filename_B);
            break;
        }
    } catch (std::exception const& e) {
        logger() << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
