#include "web/http_session.hpp"
#include "web/http_server.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace lanshare {
namespace web {

namespace beast = boost::beast;
namespace net = boost::asio;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpSession::HttpSession(net::ip::tcp::socket&& socket, HttpServer& server,
                         RequestHandler& handler, store::Store& store)
  : stream_(std::move(socket))
  , server_(server)
  , handler_(handler)
  , store_(store) {
}

HttpSession::~HttpSession() {
  discard_spool();
  server_.unregister_session(this);
}


//==============================================
// SESSION CONTROL
//==============================================

void HttpSession::run() {
  // Start on the strand the socket was accepted onto
  net::dispatch(stream_.get_executor(),
    beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::reject() {
  // The request header is still read so the client sees the answer instead of a reset
  rejecting_ = true;
  run();
}

void HttpSession::close_if_idle() {
  auto self = shared_from_this();
  net::post(stream_.get_executor(), [self]() {
    if (!self->busy_) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP session: Closing idle connection";
      self->do_close();
    }
  });
}


//==============================================
// REQUEST READING
//==============================================

void HttpSession::do_read() {
  busy_ = false;
  if (server_.is_stopping()) {
    do_close();
    return;
  }

  header_parser_.emplace();
  // Limits are applied once the header tells which kind of request this is
  header_parser_->body_limit(boost::none);
  string_parser_.reset();
  upload_parser_.reset();

  stream_.expires_after(READ_TIMEOUT);
  http::async_read_header(stream_, buffer_, *header_parser_,
    beast::bind_front_handler(&HttpSession::on_read_header, shared_from_this()));
}

void HttpSession::on_read_header(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    do_close();
    return;
  }
  if (ec) {
    if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP session: Read error: " << ec.message();
    }
    return;
  }

  busy_ = true;
  const auto& header = header_parser_->get();
  BOOST_LOG_TRIVIAL(info) << "HTTP session: " << header.method_string() << " " << header.target();

  if (rejecting_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Connection limit reached, rejecting " << header.target();
    send_status(header, false, http::status::service_unavailable);
    return;
  }

  if (RequestHandler::is_upload(header)) {
    start_upload();
    return;
  }

  // Declared lengths are only checked against the limit of the parser that read the header
  const auto length = header_parser_->content_length();
  if (length && *length > MAX_BODY_BYTES) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Request body of " << *length << " bytes too large";
    send_status(header, false, http::status::payload_too_large);
    return;
  }

  string_parser_.emplace(std::move(*header_parser_));
  string_parser_->body_limit(MAX_BODY_BYTES);

  http::async_read(stream_, buffer_, *string_parser_,
    beast::bind_front_handler(&HttpSession::on_read_body, shared_from_this()));
}

void HttpSession::on_read_body(beast::error_code ec, std::size_t) {
  if (ec == http::error::body_limit) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Request body too large";
    send_status(string_parser_->get(), false, http::status::payload_too_large);
    return;
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Failed to read request body: " << ec.message();
    return;
  }

  RequestHandler::StringRequest req = string_parser_->release();
  try {
    send(handler_.handle(req));
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Handler failed for " << req.target() << ": " << e.what();
    send_status(req, req.keep_alive(), http::status::internal_server_error);
  }
}

void HttpSession::start_upload() {
  upload_parser_.emplace(std::move(*header_parser_));
  // Upload size is only bounded by the disk
  upload_parser_->body_limit(boost::none);

  beast::error_code ec;
  spool_path_ = store_.make_temp_path("upload-", ".tmp");
  upload_parser_->get().body().open(spool_path_.string().c_str(), beast::file_mode::write, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Failed to create spool file " << spool_path_.string()
                             << ": " << ec.message();
    spool_path_.clear();
    // The body was not consumed, so the connection cannot be reused
    send_status(upload_parser_->get(), false, http::status::internal_server_error);
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Spooling upload to " << spool_path_.filename().string();

  // Clients that wait for permission before sending a large body
  const auto& header = upload_parser_->get();
  if (beast::iequals(header[http::field::expect], "100-continue")) {
    auto interim = std::make_shared<http::response<http::empty_body>>(http::status::continue_, header.version());
    http::async_write(stream_, *interim,
      [self = shared_from_this(), interim](beast::error_code write_ec, std::size_t) {
        if (write_ec) {
          BOOST_LOG_TRIVIAL(debug) << "HTTP session: Failed to send 100-continue: " << write_ec.message();
          return;
        }
        self->do_read_upload();
      });
    return;
  }

  do_read_upload();
}

void HttpSession::do_read_upload() {
  // The timeout guards each chunk rather than the whole upload
  stream_.expires_after(READ_TIMEOUT);
  http::async_read_some(stream_, buffer_, *upload_parser_,
    beast::bind_front_handler(&HttpSession::on_read_upload, shared_from_this()));
}

void HttpSession::on_read_upload(beast::error_code ec, std::size_t) {
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Upload interrupted: " << ec.message();
    upload_parser_.reset();
    discard_spool();
    return;
  }

  if (!upload_parser_->is_done()) {
    do_read_upload();
    return;
  }

  auto& req = upload_parser_->get();
  req.body().close();
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Upload body received";

  RequestHandler::RequestHeader header = req.base();
  const bool keep_alive = req.keep_alive();
  try {
    std::ifstream spool(spool_path_, std::ios::binary);
    if (!spool) {
      throw store::StoreError("HTTP session: Failed to reopen spool file");
    }
    auto response = handler_.handle_upload(header, keep_alive, spool);
    spool.close();
    discard_spool();
    send(std::move(response));
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Upload handling failed: " << e.what();
    discard_spool();
    send_status(header, keep_alive, http::status::internal_server_error);
  }
}


//==============================================
// RESPONSE WRITING
//==============================================

void HttpSession::send(RequestHandler::Response&& response) {
  response_ = std::make_shared<RequestHandler::Response>(std::move(response));

  std::visit([this](auto& msg) {
    if (server_.is_stopping()) {
      msg.keep_alive(false);
    }
    const bool close = msg.need_eof();
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Responding " << msg.result_int();

    // Large downloads may take longer than any fixed deadline
    stream_.expires_never();
    http::async_write(stream_, msg,
      beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), close));
  }, *response_);
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
  response_.reset();

  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Write error: " << ec.message();
    return;
  }

  if (close) {
    do_close();
    return;
  }

  do_read();
}

void HttpSession::send_status(const RequestHandler::RequestHeader& req, bool keep_alive, http::status status) {
  send(RequestHandler::status_response(req, keep_alive, status));
}


//==============================================
// TEARDOWN
//==============================================

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != net::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Socket shutdown: " << ec.message();
  }
  // Closing also aborts a pending header read
  stream_.close();
}

void HttpSession::discard_spool() {
  if (spool_path_.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::remove(spool_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Failed to remove spool file " << spool_path_.string()
                               << ": " << ec.message();
  }
  spool_path_.clear();
}

} // namespace web
} // namespace lanshare
