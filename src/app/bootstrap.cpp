#include "app/bootstrap.hpp"
#include "network/local_address.hpp"
#include <boost/log/trivial.hpp>
#include <csignal>
#include <cstdlib>

namespace lanshare {
namespace app {

namespace net = boost::asio;

bool open_in_browser(const std::string& url) {
#ifdef __APPLE__
  const std::string command = "open \"" + url + "\" >/dev/null 2>&1";
#else
  const std::string command = "xdg-open \"" + url + "\" >/dev/null 2>&1";
#endif
  if (std::system(command.c_str()) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Bootstrap program: Failed to open browser for " << url;
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Opened browser at " << url;
  return true;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Bootstrap::Bootstrap(const config::ServerConfig& config)
  : config_(config)
  , signals_(control_, SIGINT, SIGTERM)
  , shutdown_timer_(control_)
  , browser_timer_(control_) {

  BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initializing with storage root " << config_.storage_root.string();

  try {
    // Store first, everything else serves from it
    store_ = std::make_unique<store::Store>(config_.storage_root);
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Store created successfully";

    handler_ = std::make_unique<web::RequestHandler>(*store_,
      [this]() { return url(); },
      [this]() { request_shutdown(); });
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Request handler created successfully";

    http_server_ = std::make_unique<web::HttpServer>(config_, *handler_, *store_);
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: HTTP server created successfully";

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to initialize components: " << e.what();
    throw;
  }
}

Bootstrap::~Bootstrap() {
  try {
    shutdown();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during destructor shutdown: " << e.what();
  }
}


//==============================================
// INITIALIZATION AND DESTRUCTION METHODS
//==============================================

bool Bootstrap::start(bool open_browser) {
  try {
    // An unspecified bind address is advertised as the LAN address
    const auto bind = net::ip::make_address(config_.bind_address);
    host_ = bind.is_unspecified() ? network::resolve_local_ipv4() : bind.to_string();

    if (!http_server_->start_listener()) {
      BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start HTTP server";
      return false;
    }

    wait_for_signal();

    if (open_browser) {
      browser_timer_.expires_after(config_.browser_delay);
      browser_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
          open_in_browser(url());
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Serving at " << url();
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start: " << e.what();
    return false;
  }
}

int Bootstrap::run() {
  BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Waiting for shutdown";

  while (http_server_->is_running() && !stop_requested_) {
    control_.run_for(std::chrono::seconds(1));
    if (control_.stopped()) {
      control_.restart();
    }
  }

  if (!stop_requested_) {
    BOOST_LOG_TRIVIAL(warning) << "Bootstrap program: HTTP server stopped unexpectedly";
  }

  shutdown();
  return 0;
}

void Bootstrap::request_shutdown() {
  if (shutdown_scheduled_.exchange(true)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown requested, stopping in "
                          << config_.shutdown_delay.count() << " ms";

  // Timers belong to the control context, which only run() drives
  net::post(control_, [this]() {
    shutdown_timer_.expires_after(config_.shutdown_delay);
    shutdown_timer_.async_wait([this](const boost::system::error_code& ec) {
      if (ec != net::error::operation_aborted) {
        stop_requested_ = true;
        control_.stop();
      }
    });
  });
}

void Bootstrap::shutdown() {
  if (stopped_) {
    return;
  }
  stopped_ = true;

  BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initiating shutdown sequence";

  boost::system::error_code ec;
  signals_.cancel(ec);
  shutdown_timer_.cancel();
  browser_timer_.cancel();

  if (http_server_) {
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Shutting down HTTP server";
    http_server_->shutdown(config_.shutdown_timeout);
  }

  BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown complete";
}


//==============================================
// GETTERS
//==============================================

std::string Bootstrap::url() const {
  const std::string host = host_.empty() ? network::LOOPBACK_ADDRESS : host_;
  const uint16_t port = http_server_->port() != 0 ? http_server_->port() : config_.port;
  return network::make_server_url(host, port);
}


//==============================================
// HELPERS
//==============================================

void Bootstrap::wait_for_signal() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Received signal " << signal_number << ", stopping";
    stop_requested_ = true;
    control_.stop();
  });
}

} // namespace app
} // namespace lanshare
