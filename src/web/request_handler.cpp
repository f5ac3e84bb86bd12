#include "web/request_handler.hpp"
#include "web/mime_types.hpp"
#include "web/multipart.hpp"
#include "web/page.hpp"
#include "web/url.hpp"
#include "store/filename.hpp"
#include <boost/log/trivial.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>

namespace lanshare {
namespace web {

namespace {

const std::string FILES_PREFIX = "/files/";
const std::string DELETE_PREFIX = "/delete/";

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RequestHandler::RequestHandler(store::Store& store, UrlProvider url_provider, ShutdownHook on_shutdown)
  : store_(store)
  , url_provider_(std::move(url_provider))
  , on_shutdown_(std::move(on_shutdown)) {
  BOOST_LOG_TRIVIAL(debug) << "Request handler: Serving " << store_.root().string();
}


//==============================================
// REQUEST DISPATCH
//==============================================

bool RequestHandler::is_upload(const RequestHeader& req) {
  return req.method() == http::verb::post && strip_query(std::string(req.target())) == "/upload";
}

RequestHandler::Response RequestHandler::handle(const StringRequest& req) {
  return without_body_for_head(req, route(req, req.keep_alive()));
}

RequestHandler::Response RequestHandler::route(const StringRequest& req, bool keep_alive) {
  std::string path;
  if (!url_decode(strip_query(std::string(req.target())), path)) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Malformed target: " << req.target();
    return text(req, keep_alive, http::status::bad_request, "Bad Request");
  }

  const http::verb method = req.method();
  const bool is_get = method == http::verb::get || method == http::verb::head;

  if (path == "/") {
    if (!is_get) {
      return method_not_allowed(req, keep_alive, "GET, HEAD");
    }
    return handle_index(req, keep_alive);
  }
  if (path == "/_files_json") {
    if (!is_get) {
      return method_not_allowed(req, keep_alive, "GET, HEAD");
    }
    return handle_files_json(req, keep_alive);
  }
  if (path == "/upload") {
    if (method != http::verb::post) {
      return method_not_allowed(req, keep_alive, "POST");
    }
    std::istringstream body(req.body());
    return handle_upload(req, keep_alive, body);
  }
  if (path == "/shutdown") {
    if (method != http::verb::post) {
      return method_not_allowed(req, keep_alive, "POST");
    }
    return handle_shutdown(req, keep_alive);
  }
  if (starts_with(path, FILES_PREFIX)) {
    if (!is_get) {
      return method_not_allowed(req, keep_alive, "GET, HEAD");
    }
    return handle_download(req, keep_alive, path.substr(FILES_PREFIX.size()));
  }
  if (starts_with(path, DELETE_PREFIX)) {
    // Deletion stays reachable through GET so plain links work from any browser
    if (method != http::verb::get) {
      return method_not_allowed(req, keep_alive, "GET");
    }
    return handle_delete(req, keep_alive, path.substr(DELETE_PREFIX.size()));
  }

  return not_found(req, keep_alive);
}

RequestHandler::Response RequestHandler::handle_upload(const RequestHeader& req, bool keep_alive,
                                                       std::istream& body) {
  const std::string boundary =
    MultipartReader::boundary_from_content_type(std::string(req[http::field::content_type]));
  if (boundary.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Upload without multipart boundary";
    return text(req, keep_alive, http::status::bad_request, "Bad Request: expected multipart/form-data");
  }

  std::unique_ptr<store::FileWriter> writer;
  std::size_t saved = 0;

  try {
    MultipartReader reader(boundary);
    reader.read(body,
      [this, &writer](const PartHeaders& part) -> std::ostream* {
        if (part.name != UPLOAD_FIELD || !part.has_filename || part.filename.empty()) {
          BOOST_LOG_TRIVIAL(debug) << "Request handler: Skipping part " << part.name << " without filename";
          return nullptr;
        }

        const std::string name = store::sanitize_filename(part.filename);
        if (name.empty()) {
          BOOST_LOG_TRIVIAL(warning) << "Request handler: Skipping upload with unusable name: " << part.filename;
          return nullptr;
        }

        BOOST_LOG_TRIVIAL(info) << "Request handler: Receiving upload " << part.filename << " as " << name;
        writer = store_.open_writer(name);
        return &writer->stream();
      },
      [&writer, &saved](const PartHeaders&) {
        if (!writer) {
          return;
        }
        const auto bytes = writer->bytes_written();
        writer->commit();
        BOOST_LOG_TRIVIAL(info) << "Request handler: Saved " << writer->final_path().filename().string()
                                << " (" << bytes << " bytes)";
        writer.reset();
        ++saved;
      });
  }
  catch (const MultipartError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Rejected upload: " << e.what();
    return text(req, keep_alive, http::status::bad_request, "Bad Request");
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Upload failed after " << saved << " files: " << e.what();
    return text(req, keep_alive, http::status::internal_server_error, "Internal Server Error");
  }

  BOOST_LOG_TRIVIAL(info) << "Request handler: Upload complete, " << saved << " files saved";
  return redirect(req, keep_alive, "/");
}


//==============================================
// ROUTES
//==============================================

RequestHandler::Response RequestHandler::handle_index(const RequestHeader& req, bool keep_alive) {
  IndexPage page;
  page.url = url_provider_ ? url_provider_() : "/";
  page.folder_name = store_.root().filename().string();
  page.listing = store_.list();

  return text(req, keep_alive, http::status::ok, render_index(page), "text/html; charset=utf-8");
}

RequestHandler::Response RequestHandler::handle_files_json(const RequestHeader& req, bool keep_alive) {
  const store::Listing listing = store_.list();

  nlohmann::json body;
  body["names"] = listing.names;
  body["sizes_by_name"] = listing.sizes_by_name;

  // Names copied in from elsewhere need not be valid UTF-8
  const std::string dumped = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return text(req, keep_alive, http::status::ok, dumped, "application/json");
}

RequestHandler::Response RequestHandler::handle_download(const RequestHeader& req, bool keep_alive,
                                                         const std::string& name) {
  // Hidden names cover the server's own spool and partial files
  if (store::is_hidden(name) || !store_.has(name)) {
    BOOST_LOG_TRIVIAL(info) << "Request handler: Download refused for " << name;
    return not_found(req, keep_alive);
  }

  boost::beast::error_code ec;
  http::file_body::value_type body;
  body.open(store_.path_of(name).c_str(), boost::beast::file_mode::scan, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Failed to open " << name << ": " << ec.message();
    return not_found(req, keep_alive);
  }

  const auto size = body.size();
  const std::string content_type = mime_type(name);

  if (req.method() == http::verb::head) {
    EmptyResponse res{http::status::ok, req.version()};
    res.set(http::field::content_type, content_type);
    res.content_length(size);
    res.keep_alive(keep_alive);
    return res;
  }

  FileResponse res{
    std::piecewise_construct,
    std::make_tuple(std::move(body)),
    std::make_tuple(http::status::ok, req.version())};
  res.set(http::field::content_type, content_type);
  res.content_length(size);
  res.keep_alive(keep_alive);

  BOOST_LOG_TRIVIAL(info) << "Request handler: Sending " << name << " (" << size << " bytes)";
  return Response(std::move(res));
}

RequestHandler::Response RequestHandler::handle_delete(const RequestHeader& req, bool keep_alive,
                                                       const std::string& name) {
  if (name.empty()) {
    return not_found(req, keep_alive);
  }

  // A missing, hidden or unsafe name is not an error for the client
  if (store::is_hidden(name)) {
    BOOST_LOG_TRIVIAL(info) << "Request handler: Delete refused for hidden name " << name;
  } else {
    store_.remove(name);
  }
  return redirect(req, keep_alive, "/");
}

RequestHandler::Response RequestHandler::handle_shutdown(const RequestHeader& req, bool keep_alive) {
  BOOST_LOG_TRIVIAL(info) << "Request handler: Shutdown requested by client";
  if (on_shutdown_) {
    on_shutdown_();
  }
  return text(req, keep_alive, http::status::ok, "Shutting down...");
}


//==============================================
// RESPONSE BUILDERS
//==============================================

RequestHandler::Response RequestHandler::status_response(const RequestHeader& req, bool keep_alive,
                                                         http::status status) {
  return without_body_for_head(req,
    text(req, keep_alive, status, std::string(http::obsolete_reason(status))));
}

RequestHandler::StringResponse RequestHandler::text(const RequestHeader& req, bool keep_alive, http::status status,
                                                    const std::string& body, const std::string& content_type) {
  StringResponse res{status, req.version()};
  res.set(http::field::content_type, content_type);
  res.keep_alive(keep_alive);
  res.body() = body;
  res.prepare_payload();
  return res;
}

RequestHandler::StringResponse RequestHandler::redirect(const RequestHeader& req, bool keep_alive,
                                                        const std::string& location) {
  StringResponse res = text(req, keep_alive, http::status::found, "Redirecting to " + location);
  res.set(http::field::location, location);
  return res;
}

RequestHandler::StringResponse RequestHandler::method_not_allowed(const RequestHeader& req, bool keep_alive,
                                                                  const std::string& allow) {
  StringResponse res = text(req, keep_alive, http::status::method_not_allowed, "Method Not Allowed");
  res.set(http::field::allow, allow);
  return res;
}

RequestHandler::StringResponse RequestHandler::not_found(const RequestHeader& req, bool keep_alive) {
  return text(req, keep_alive, http::status::not_found, "Not Found");
}

RequestHandler::Response RequestHandler::without_body_for_head(const RequestHeader& req, Response res) {
  if (req.method() != http::verb::head || !std::holds_alternative<StringResponse>(res)) {
    return res;
  }

  // The header already carries the Content-Length of the GET body
  EmptyResponse head{std::move(std::get<StringResponse>(res).base())};
  return head;
}

} // namespace web
} // namespace lanshare
