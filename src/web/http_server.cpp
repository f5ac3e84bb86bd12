#include "web/http_server.hpp"
#include "web/http_session.hpp"
#include <boost/log/trivial.hpp>

namespace lanshare {
namespace web {

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const config::ServerConfig& config, RequestHandler& handler, store::Store& store)
  : address_(config.bind_address)
  , port_(config.port)
  , worker_threads_(config::effective_worker_threads(config))
  , max_connections_(config.max_connections)
  , handler_(handler)
  , store_(store) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address_ << ":" << port_
                          << " with " << worker_threads_ << " worker threads";
}

HttpServer::~HttpServer() {
  shutdown(std::chrono::milliseconds(0));
  stop_workers();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  // Drops whatever a previous run left behind
  stop_workers();

  try {
    io_context_ = std::make_unique<net::io_context>(static_cast<int>(worker_threads_));

    tcp::endpoint endpoint(net::ip::make_address(address_), port_);
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Endpoint created";

    // Acceptor lives on its own strand so shutdown can close it safely
    acceptor_ = std::make_unique<tcp::acceptor>(net::make_strand(*io_context_));
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(net::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor bound to port " << bound_port_;

    stopping_ = false;
    failed_ = false;
    is_running_ = true;

    // Start accepting connections
    start_accept();

    work_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
      io_context_->get_executor());
    for (std::size_t i = 0; i < worker_threads_; ++i) {
      io_threads_.emplace_back(&HttpServer::run_worker, this, i);
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    acceptor_.reset();
    io_context_.reset();
    return false;
  }
}

void HttpServer::shutdown(std::chrono::milliseconds timeout) {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";
  stopping_ = true;

  // Stop accepting new connections
  net::post(acceptor_->get_executor(), [this]() {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  });

  // Idle keep-alive connections would otherwise hold the drain open
  std::vector<std::shared_ptr<HttpSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& entry : sessions_) {
      if (auto session = entry.second.lock()) {
        sessions.push_back(std::move(session));
      }
    }
  }
  for (auto& session : sessions) {
    session->close_if_idle();
  }
  sessions.clear();

  // Wait for in-flight requests
  {
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    const bool drained = sessions_cv_.wait_for(lock, timeout, [this]() { return sessions_.empty(); });
    if (drained) {
      BOOST_LOG_TRIVIAL(info) << "HTTP server: All connections drained";
    } else {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: " << sessions_.size()
                                 << " connections still active after " << timeout.count() << " ms, forcing shutdown";
    }
  }

  // Stop io_context
  work_.reset();
  io_context_->stop();

  // Wait for the worker threads to finish
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  is_running_ = false;
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

void HttpServer::stop_workers() {
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // Destroying the io_context releases sessions that never got to finish
  work_.reset();
  acceptor_.reset();
  io_context_.reset();
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || stopping_) {
    return;
  }

  // Each connection gets its own strand
  acceptor_->async_accept(net::make_strand(*io_context_),
    [this](const boost::system::error_code& error, tcp::socket socket) {
      on_accept(error, std::move(socket));
    });
}

void HttpServer::on_accept(const boost::system::error_code& error, tcp::socket socket) {
  if (error == net::error::operation_aborted) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accept loop stopped";
    return;
  }

  if (error) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
  } else {
    boost::system::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection from "
                             << (ec ? std::string("unknown peer") : remote.address().to_string());

    auto session = std::make_shared<HttpSession>(std::move(socket), *this, handler_, store_);
    if (register_session(session)) {
      session->run();
    } else {
      session->reject();
    }
  }

  start_accept();  // Continue accepting new connections
}

void HttpServer::run_worker(std::size_t index) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Worker " << index << " started";
  try {
    io_context_->run();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Worker " << index << " failed: " << e.what();
    failed_ = true;
  }
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Worker " << index << " stopped";
}


//==============================================
// SESSION REGISTRY
//==============================================

bool HttpServer::register_session(const std::shared_ptr<HttpSession>& session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  const bool accepted = sessions_.size() < max_connections_;
  sessions_.emplace(session.get(), session);
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Active connections: " << sessions_.size();
  return accepted;
}

void HttpServer::unregister_session(HttpSession* session) {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
  }
  sessions_cv_.notify_all();
}

std::size_t HttpServer::active_sessions() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

} // namespace web
} // namespace lanshare
