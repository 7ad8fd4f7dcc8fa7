#ifndef PEERDROP_LOGGER_HPP
#define PEERDROP_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace peerdrop::logging {

using severity_level = boost::log::trivial::severity_level;

struct LogOptions {
    severity_level severity = boost::log::trivial::info;
    // Empty disables the file sink
    std::string file;
    bool console = true;
};

// Accepts trace, debug, info, warning, error or fatal.
// Throws std::invalid_argument for anything else.
severity_level parse_severity(const std::string& name);

// Replaces every existing sink. With neither sink requested, logging is
// disabled rather than falling back to the Boost.Log default sink.
void init_logging(const LogOptions& options);

void set_log_level(severity_level level);

} // namespace peerdrop::logging

#endif // PEERDROP_LOGGER_HPP
