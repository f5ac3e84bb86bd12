#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace lanshare {
namespace config {

// Default values used when the command line leaves a setting out
constexpr uint16_t DEFAULT_PORT = 8000;
constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0";
constexpr const char* DEFAULT_STORAGE_DIR = "shared";
constexpr std::size_t DEFAULT_MAX_CONNECTIONS = 64;

struct ServerConfig {
  // ---- NETWORK ----
  std::string bind_address = DEFAULT_BIND_ADDRESS;
  uint16_t port = DEFAULT_PORT;
  // Port 0 asks the OS for a free port, only honoured when set
  bool allow_ephemeral_port = false;

  // ---- STORAGE ----
  std::filesystem::path storage_root = DEFAULT_STORAGE_DIR;

  // ---- CONCURRENCY ----
  // 0 selects the hardware concurrency (at least 2)
  std::size_t worker_threads = 0;
  std::size_t max_connections = DEFAULT_MAX_CONNECTIONS;

  // ---- LIFECYCLE ----
  // Time between a /shutdown request and the start of the drain
  std::chrono::milliseconds shutdown_delay{1000};
  // Upper bound on waiting for in-flight requests during the drain
  std::chrono::milliseconds shutdown_timeout{5000};
  // Settle time before the browser is launched
  std::chrono::milliseconds browser_delay{1000};
  bool open_browser = false;

  // ---- LOGGING ----
  std::string log_file;
  std::string log_level = "info";
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Throws ConfigError when a setting cannot be used to start the server
void validate(const ServerConfig& config);

// Resolves worker_threads = 0 to a concrete thread count
std::size_t effective_worker_threads(const ServerConfig& config);

} // namespace config
} // namespace lanshare
