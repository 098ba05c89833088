#ifndef STUBCAS_LOGGER_HPP
#define STUBCAS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace stubcas {
namespace logger {

struct LogOptions {
    boost::log::trivial::severity_level min_level{boost::log::trivial::info};
    // Console sink on std::clog
    bool console{true};
    // Empty disables the file sink
    std::string log_file;
    std::size_t rotation_size{10 * 1024 * 1024};  // 10 MB
};

// Parses trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
boost::log::trivial::severity_level parse_severity(const std::string& name);

// Replaces any installed sinks with the configured ones
void init_logging(const LogOptions& options);

// Changes the minimum severity without touching the sinks
void set_log_level(boost::log::trivial::severity_level level);

} // namespace logger
} // namespace stubcas

#endif // STUBCAS_LOGGER_HPP
