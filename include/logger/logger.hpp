#ifndef DISK_LOGGER_LOGGER_HPP
#define DISK_LOGGER_LOGGER_HPP

#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>

namespace disk::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous text file sink, replacing any existing sinks
void init_logging(const std::string& log_file, severity_level min_level = severity_level::info);

// Installs a console sink on std::clog, replacing any existing sinks
void init_console_logging(severity_level min_level = severity_level::warning);

// Changes the minimum severity let through by the core
void set_log_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

} // namespace disk::logging

#endif // DISK_LOGGER_LOGGER_HPP
