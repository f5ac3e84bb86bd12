#include "config/server_config.hpp"
#include "logger/logger.hpp"
#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <boost/log/trivial.hpp>
#include <thread>

namespace lanshare {
namespace config {

void validate(const ServerConfig& config) {
  if (config.port == 0 && !config.allow_ephemeral_port) {
    throw ConfigError("Config: Port must be between 1 and 65535");
  }

  boost::system::error_code ec;
  boost::asio::ip::make_address(config.bind_address, ec);
  if (ec) {
    throw ConfigError("Config: Invalid bind address: " + config.bind_address);
  }

  if (config.storage_root.empty()) {
    throw ConfigError("Config: Storage directory must not be empty");
  }

  if (config.max_connections == 0) {
    throw ConfigError("Config: Connection limit must be at least 1");
  }

  boost::log::trivial::severity_level level;
  if (!logger::parse_severity(config.log_level, level)) {
    throw ConfigError("Config: Unknown log level: " + config.log_level);
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Configuration validated for " << config.bind_address
                           << ":" << config.port << " serving " << config.storage_root.string();
}

std::size_t effective_worker_threads(const ServerConfig& config) {
  if (config.worker_threads > 0) {
    return config.worker_threads;
  }
  return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}

} // namespace config
} // namespace lanshare
