#ifndef IFS_LOGGER_HPP
#define IFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace ifs::logging {

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Returns false and leaves level untouched on an unknown name.
bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level);

// Installs a console sink and, when log_file is non-empty, a rotating file sink.
// Any sinks installed earlier are removed first.
void init_logging(boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  const std::string& log_file = "");

// Changes the minimum severity without touching sinks
void set_log_level(boost::log::trivial::severity_level min_level);

} // namespace ifs::logging

#endif // IFS_LOGGER_HPP
