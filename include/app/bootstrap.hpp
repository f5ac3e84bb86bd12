#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include "config/server_config.hpp"
#include "store/store.hpp"
#include "web/http_server.hpp"
#include "web/request_handler.hpp"

namespace lanshare {
namespace app {

// Opens url in the desktop browser, false when the launcher fails
bool open_in_browser(const std::string& url);

class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Bootstrap(const config::ServerConfig& config);
  ~Bootstrap();

  Bootstrap(const Bootstrap&) = delete;
  Bootstrap& operator=(const Bootstrap&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the listener in the background and schedules the browser launch
  bool start(bool open_browser);
  // Blocks until the listener ends, a stop signal arrives or a shutdown was requested
  int run();
  // Stops the server after the configured delay, safe to call from any thread
  void request_shutdown();
  // Drains and stops the server, safe to call more than once
  void shutdown();


  // ---- GETTERS ----
  // URL other devices should open
  std::string url() const;
  bool stop_requested() const { return stop_requested_; }
  store::Store& get_store() { return *store_; }
  web::HttpServer& get_http_server() { return *http_server_; }

private:
  // ---- PARAMETERS ----
  config::ServerConfig config_;
  // Host part of the advertised URL
  std::string host_;

  // System components
  std::unique_ptr<store::Store> store_;
  std::unique_ptr<web::RequestHandler> handler_;
  std::unique_ptr<web::HttpServer> http_server_;

  // Signals and timers, driven by run() on the caller's thread
  boost::asio::io_context control_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer shutdown_timer_;
  boost::asio::steady_timer browser_timer_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> shutdown_scheduled_{false};
  bool stopped_ = false;


  // ---- HELPERS ----
  void wait_for_signal();
};

} // namespace app
} // namespace lanshare
