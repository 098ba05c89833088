#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace stubcas {
namespace logger {

boost::log::trivial::severity_level parse_severity(const std::string& name) {
    namespace trivial = boost::log::trivial;
    if (name == "trace") return trivial::trace;
    if (name == "debug") return trivial::debug;
    if (name == "info") return trivial::info;
    if (name == "warning") return trivial::warning;
    if (name == "error") return trivial::error;
    if (name == "fatal") return trivial::fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

void init_logging(const LogOptions& options) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    try {
        // Remove any existing sinks to prevent duplicates
        logging::core::get()->remove_all_sinks();

        // Add common attributes
        logging::add_common_attributes();

        auto format = (
            expr::stream
                << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
                << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
                << " [" << logging::trivial::severity << "]"
                << " " << expr::smessage
        );

        if (options.console) {
            logging::add_console_log(
                std::clog,
                keywords::format = format,
                keywords::auto_flush = true
            );
        }

        if (!options.log_file.empty()) {
            logging::add_file_log(
                keywords::file_name = options.log_file,
                keywords::format = format,
                keywords::rotation_size = options.rotation_size,
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::auto_flush = true
            );
        }

        // Set the minimum severity level
        set_log_level(options.min_level);
        logging::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(boost::log::trivial::severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

} // namespace logger
} // namespace stubcas
