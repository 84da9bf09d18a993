#ifndef PODFS_LOGGER_HPP
#define PODFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace podfs::logging {

using severity_level = boost::log::trivial::severity_level;

// Rotating text file sink: "<timestamp> [<severity>] [Thread <id>] <message>"
void init_logging(const std::string& log_file = "podfs.log",
                  severity_level min_level = severity_level::info);

// Console sink, used by the shell when no log file is configured and by tests
void init_console_logging(severity_level min_level = severity_level::info);

// Parses trace/debug/info/warning/error/fatal, throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

} // namespace podfs::logging

#endif // PODFS_LOGGER_HPP
