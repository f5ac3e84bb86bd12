#ifndef LANSHARE_LOGGER_HPP
#define LANSHARE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace lanshare::logger {

struct LogOptions {
  // Records at or above this level reach the sinks
  boost::log::trivial::severity_level min_level = boost::log::trivial::info;
  // Console sink writes to stderr so stdout stays free for the banner
  bool console = true;
  // Optional text file sink, empty to disable
  std::string log_file;
};

// Installs the console and file sinks, replacing any existing ones
void init_logging(const LogOptions& options = LogOptions());

// Changes the minimum severity at run time
void set_log_level(boost::log::trivial::severity_level level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_severity(const std::string& text, boost::log::trivial::severity_level& level);

} // namespace lanshare::logger

#endif // LANSHARE_LOGGER_HPP
