#ifndef VSTORE_LOGGER_HPP
#define VSTORE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace vstore::logger {

using severity_level = boost::log::trivial::severity_level;

// Parses trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

// Replaces all sinks with a synchronous text file sink
void init_logging(const std::string& log_file = "vstore.log",
                  severity_level min_level = severity_level::info);

// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = severity_level::info);

} // namespace vstore::logger

#endif // VSTORE_LOGGER_HPP
