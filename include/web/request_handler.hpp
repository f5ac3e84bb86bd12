#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <istream>
#include <string>
#include <variant>
#include "store/store.hpp"

namespace lanshare {
namespace web {

namespace http = boost::beast::http;

class RequestHandler {
public:
  using StringRequest = http::request<http::string_body>;
  using RequestHeader = http::request_header<>;

  using StringResponse = http::response<http::string_body>;
  using FileResponse = http::response<http::file_body>;
  using EmptyResponse = http::response<http::empty_body>;
  using Response = std::variant<StringResponse, FileResponse, EmptyResponse>;

  // Returns the URL other devices should use, evaluated per index request
  using UrlProvider = std::function<std::string()>;
  using ShutdownHook = std::function<void()>;

  // Form field carrying uploaded files
  static constexpr const char* UPLOAD_FIELD = "file";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  RequestHandler(store::Store& store, UrlProvider url_provider, ShutdownHook on_shutdown);


  // ---- REQUEST DISPATCH ----
  // Routes a fully read request; uploads use the in-memory body
  Response handle(const StringRequest& req);
  // Handles POST /upload with the body read from a stream (spooled uploads)
  Response handle_upload(const RequestHeader& req, bool keep_alive, std::istream& body);
  // True for requests whose body should be spooled to disk instead of memory
  static bool is_upload(const RequestHeader& req);
  // Plain-text response carrying the status reason, for failures outside the routes
  static Response status_response(const RequestHeader& req, bool keep_alive, http::status status);

private:
  // ---- PARAMETERS ----
  store::Store& store_;
  UrlProvider url_provider_;
  ShutdownHook on_shutdown_;


  // ---- ROUTES ----
  Response route(const StringRequest& req, bool keep_alive);
  Response handle_index(const RequestHeader& req, bool keep_alive);
  Response handle_files_json(const RequestHeader& req, bool keep_alive);
  Response handle_download(const RequestHeader& req, bool keep_alive, const std::string& name);
  Response handle_delete(const RequestHeader& req, bool keep_alive, const std::string& name);
  Response handle_shutdown(const RequestHeader& req, bool keep_alive);


  // ---- RESPONSE BUILDERS ----
  static StringResponse text(const RequestHeader& req, bool keep_alive, http::status status,
                             const std::string& body,
                             const std::string& content_type = "text/plain; charset=utf-8");
  static StringResponse redirect(const RequestHeader& req, bool keep_alive, const std::string& location);
  static StringResponse method_not_allowed(const RequestHeader& req, bool keep_alive, const std::string& allow);
  static StringResponse not_found(const RequestHeader& req, bool keep_alive);
  // A HEAD answer keeps the status and headers of the GET answer but carries no body
  static Response without_body_for_head(const RequestHeader& req, Response res);
};

} // namespace web
} // namespace lanshare
