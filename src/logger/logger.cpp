#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <filesystem>
#include <iostream>

namespace lanshare::logger {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

void init_logging(const LogOptions& options) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    const auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
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
      std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::format = format,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    set_log_level(options.min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                             << (options.log_file.empty() ? "" : " with file: " + options.log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(logging::trivial::severity_level level) {
  logging::core::get()->set_filter(logging::trivial::severity >= level);
}

void enable_logging() {
  logging::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  logging::core::get()->set_logging_enabled(false);
}

bool parse_severity(const std::string& text, logging::trivial::severity_level& level) {
  if (text == "trace")   { level = logging::trivial::trace;   return true; }
  if (text == "debug")   { level = logging::trivial::debug;   return true; }
  if (text == "info")    { level = logging::trivial::info;    return true; }
  if (text == "warning") { level = logging::trivial::warning; return true; }
  if (text == "error")   { level = logging::trivial::error;   return true; }
  if (text == "fatal")   { level = logging::trivial::fatal;   return true; }
  return false;
}

} // namespace lanshare::logger
