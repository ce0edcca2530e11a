#pragma once

#include <iostream>
#include <string>

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

namespace logging = boost::log;
namespace keywords = boost::log::keywords;

namespace ranksim {

#define RANKSIM_LOG BOOST_LOG_TRIVIAL(info)
#define RANKSIM_WARN BOOST_LOG_TRIVIAL(warning)

inline void init_logging()
{
    boost::log::core::get()->remove_all_sinks();
    boost::log::core::get()->add_global_attribute("TimeStamp", boost::log::attributes::local_clock());
    logging::add_console_log(std::clog, keywords::format = "[%TimeStamp%]: %Message%");
}

inline void start_logging_to_file(std::string const& filename)
{
    init_logging();
    logging::add_file_log
        (
            keywords::file_name = filename,
            keywords::format = "[%TimeStamp%]: %Message%",
            keywords::auto_flush = true
        );
}

inline void stop_logging_to_file()
{
    init_logging();
}

}  // namespace ranksim
