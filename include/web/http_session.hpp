#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/optional.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include "store/store.hpp"
#include "web/request_handler.hpp"

namespace lanshare {
namespace web {

class HttpServer;

// One HTTP/1.1 connection. Every handler runs on the connection's strand.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  // Longest wait for the next request header or upload chunk
  static constexpr std::chrono::seconds READ_TIMEOUT{30};
  // Bodies of requests other than uploads are read into memory up to this size
  static constexpr std::uint64_t MAX_BODY_BYTES = 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpSession(boost::asio::ip::tcp::socket&& socket, HttpServer& server,
              RequestHandler& handler, store::Store& store);
  ~HttpSession();


  // ---- SESSION CONTROL ----
  // Starts reading requests
  void run();
  // Answers the first request with 503, then closes
  void reject();
  // Closes the connection if it is waiting for a request; busy sessions finish first
  void close_if_idle();

private:
  // ---- PARAMETERS ----
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  HttpServer& server_;
  RequestHandler& handler_;
  store::Store& store_;

  // Header is read first, then the parser is converted for the body
  boost::optional<http::request_parser<http::empty_body>> header_parser_;
  boost::optional<http::request_parser<http::string_body>> string_parser_;
  boost::optional<http::request_parser<http::file_body>> upload_parser_;
  // Raw upload body spooled to disk, removed once handled
  std::filesystem::path spool_path_;

  // Response being written, kept alive until the write completes
  std::shared_ptr<RequestHandler::Response> response_;
  // Set while a request is being read, handled or answered
  bool busy_ = false;
  // Over the connection limit, only a 503 is sent
  bool rejecting_ = false;


  // ---- REQUEST READING ----
  void do_read();
  void on_read_header(boost::beast::error_code ec, std::size_t bytes_transferred);
  void on_read_body(boost::beast::error_code ec, std::size_t bytes_transferred);
  void start_upload();
  void do_read_upload();
  void on_read_upload(boost::beast::error_code ec, std::size_t bytes_transferred);


  // ---- RESPONSE WRITING ----
  void send(RequestHandler::Response&& response);
  void on_write(bool close, boost::beast::error_code ec, std::size_t bytes_transferred);
  // Answers with a bare status, used when the request cannot reach the handler
  void send_status(const RequestHandler::RequestHeader& req, bool keep_alive, http::status status);


  // ---- TEARDOWN ----
  void do_close();
  void discard_spool();
};

} // namespace web
} // namespace lanshare
