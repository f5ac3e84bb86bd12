#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config/server_config.hpp"
#include "store/store.hpp"
#include "web/request_handler.hpp"

namespace lanshare {
namespace web {

class HttpSession;

class HttpServer {
public:
  friend class HttpSession;  // Sessions register and unregister themselves

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const config::ServerConfig& config, RequestHandler& handler, store::Store& store);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the acceptor and starts the worker pool, false if already running or binding fails
  bool start_listener();
  // Stops accepting, closes idle connections and waits up to timeout for
  // in-flight requests before stopping the worker pool
  void shutdown(std::chrono::milliseconds timeout);


  // ---- GETTERS ----
  // False once shut down or after a worker thread failed
  bool is_running() const { return is_running_ && !failed_; }
  bool is_stopping() const { return stopping_; }
  // Port actually bound, meaningful after start_listener()
  uint16_t port() const { return bound_port_; }
  std::size_t active_sessions() const;

private:

  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;
  const std::size_t worker_threads_;
  const std::size_t max_connections_;

  // System components
  RequestHandler& handler_;
  store::Store& store_;

  // Session registry, outlives the io_context so session destructors can unregister
  mutable std::mutex sessions_mutex_;
  std::condition_variable sessions_cv_;
  std::map<HttpSession*, std::weak_ptr<HttpSession>> sessions_;

  // Server state
  std::atomic<bool> is_running_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> failed_{false};
  std::atomic<uint16_t> bound_port_{0};

  // Incoming connection handlers
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::vector<std::thread> io_threads_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  void on_accept(const boost::system::error_code& error, boost::asio::ip::tcp::socket socket);
  // Worker loop run by each pool thread
  void run_worker(std::size_t index);


  // ---- SESSION REGISTRY ----
  // Registers a session, false when the connection limit is exceeded
  bool register_session(const std::shared_ptr<HttpSession>& session);
  void unregister_session(HttpSession* session);
  // Joins the pool and releases the io_context
  void stop_workers();
};

} // namespace web
} // namespace lanshare
