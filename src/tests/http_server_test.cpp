#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include "config/server_config.hpp"
#include "store/store.hpp"
#include "web/http_server.hpp"
#include "web/http_session.hpp"
#include "web/request_handler.hpp"
#include "test_utils.hpp"

using namespace lanshare;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class HttpServerTest : public ::testing::Test {
protected:
  const std::string BOUNDARY = "serverTestBoundary";

  std::filesystem::path test_dir;
  config::ServerConfig config;
  std::unique_ptr<store::Store> store;
  std::unique_ptr<web::RequestHandler> handler;
  std::unique_ptr<web::HttpServer> server;
  std::atomic<int> shutdown_calls{0};

  net::io_context client_context;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("http_server_test");

    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.allow_ephemeral_port = true;
    config.storage_root = test_dir;
    config.worker_threads = 2;

    store = std::make_unique<store::Store>(test_dir);
    handler = std::make_unique<web::RequestHandler>(*store,
      []() { return std::string("http://127.0.0.1/"); },
      [this]() { ++shutdown_calls; });
  }

  void TearDown() override {
    server.reset();
    handler.reset();
    store.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  void start_server() {
    server = std::make_unique<web::HttpServer>(config, *handler, *store);
    ASSERT_TRUE(server->start_listener());
    ASSERT_NE(server->port(), 0);
  }

  std::unique_ptr<beast::tcp_stream> connect() {
    auto stream = std::make_unique<beast::tcp_stream>(client_context);
    stream->expires_after(std::chrono::seconds(10));
    stream->connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server->port()));
    return stream;
  }

  http::request<http::string_body> make_request(http::verb method, const std::string& target,
                                                bool keep_alive = false) {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(keep_alive);
    return req;
  }

  http::request<http::string_body> make_upload(const std::vector<std::pair<std::string, std::string>>& files) {
    auto req = make_request(http::verb::post, "/upload");
    req.set(http::field::content_type, "multipart/form-data; boundary=" + BOUNDARY);
    req.body() = make_multipart(BOUNDARY, "file", files);
    req.prepare_payload();
    return req;
  }

  http::response<http::string_body> exchange(beast::tcp_stream& stream, http::request<http::string_body>& req) {
    http::write(stream, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    return res;
  }

  // One request on a fresh connection
  http::response<http::string_body> send(http::request<http::string_body> req) {
    auto stream = connect();
    auto res = exchange(*stream, req);
    beast::error_code ec;
    stream->socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
  }

  // True once the peer closed the connection
  static bool closed_by_server(beast::tcp_stream& stream) {
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code ec;
    http::read(stream, buffer, res, ec);
    return ec == http::error::end_of_stream || ec == net::error::eof || ec == net::error::connection_reset;
  }

  bool wait_for_sessions(std::size_t count, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      if (server->active_sessions() == count) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  // Waits until the server started spooling an upload body
  bool wait_for_spool(std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      for (const auto& name : raw_entries()) {
        if (name.rfind(".upload-", 0) == 0) {
          return true;
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  std::vector<std::string> raw_entries() const {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
      names.push_back(entry.path().filename().string());
    }
    return names;
  }
};

TEST_F(HttpServerTest, StartListenerTest) {
  start_server();
  EXPECT_TRUE(server->is_running());
  EXPECT_FALSE(server->is_stopping());
}

TEST_F(HttpServerTest, MultipleStartTest) {
  start_server();
  EXPECT_FALSE(server->start_listener());  // Second start should fail
}

TEST_F(HttpServerTest, ShutdownTest) {
  start_server();
  server->shutdown(std::chrono::milliseconds(1000));
  EXPECT_FALSE(server->is_running());

  // Should be able to start again after shutdown
  ASSERT_TRUE(server->start_listener());
  EXPECT_EQ(send(make_request(http::verb::get, "/")).result(), http::status::ok);
}

TEST_F(HttpServerTest, PortInUseFails) {
  start_server();
  config.port = server->port();
  web::HttpServer second(config, *handler, *store);
  EXPECT_FALSE(second.start_listener());
  EXPECT_FALSE(second.is_running());
}

TEST_F(HttpServerTest, UploadThenDownload) {
  start_server();

  const auto upload = send(make_upload({{"a.txt", "hello"}}));
  EXPECT_EQ(upload.result(), http::status::found);
  EXPECT_EQ(upload[http::field::location], "/");

  const auto download = send(make_request(http::verb::get, "/files/a.txt"));
  EXPECT_EQ(download.result(), http::status::ok);
  EXPECT_EQ(download.body(), "hello");
  EXPECT_EQ(download[http::field::content_type], "text/plain");
}

TEST_F(HttpServerTest, LargeUploadIsSpooledAndCleanedUp) {
  start_server();

  std::string payload(3 * 1024 * 1024, '\0');
  for (size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<char>(i % 251);
  }

  EXPECT_EQ(send(make_upload({{"big.bin", payload}})).result(), http::status::found);
  EXPECT_EQ(read_file(test_dir / "big.bin"), payload);
  // No spool or partial file survives the request
  EXPECT_EQ(raw_entries(), (std::vector<std::string>{"big.bin"}));
}

TEST_F(HttpServerTest, DeleteAndListing) {
  start_server();
  send(make_upload({{"b.txt", "b"}}));
  send(make_upload({{"a.txt", "a"}}));

  auto listing = send(make_request(http::verb::get, "/_files_json"));
  EXPECT_EQ(listing.body(), R"({"names":["a.txt","b.txt"],"sizes_by_name":{"a.txt":"0.0 KB","b.txt":"0.0 KB"}})");

  EXPECT_EQ(send(make_request(http::verb::get, "/delete/a.txt")).result(), http::status::found);
  EXPECT_EQ(send(make_request(http::verb::get, "/delete/missing.txt")).result(), http::status::found);

  listing = send(make_request(http::verb::get, "/_files_json"));
  EXPECT_EQ(listing.body(), R"({"names":["b.txt"],"sizes_by_name":{"b.txt":"0.0 KB"}})");
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests) {
  start_server();
  auto stream = connect();

  for (int i = 0; i < 3; ++i) {
    auto req = make_request(http::verb::get, "/", true);
    const auto res = exchange(*stream, req);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(res.keep_alive());
  }
  EXPECT_EQ(server->active_sessions(), 1u);
}

TEST_F(HttpServerTest, HeadKeepsConnectionInSync) {
  start_server();
  auto stream = connect();
  beast::flat_buffer buffer;

  for (const std::string target : {"/_files_json", "/files/missing.txt", "/shutdown"}) {
    auto head = make_request(http::verb::head, target, true);
    http::write(*stream, head);

    http::response_parser<http::empty_body> head_parser;
    head_parser.skip(true);
    http::read(*stream, buffer, head_parser);
    EXPECT_TRUE(head_parser.get().keep_alive()) << target;

    // Any body bytes after the HEAD answer would break this read
    auto get = make_request(http::verb::get, "/_files_json", true);
    http::write(*stream, get);
    http::response<http::string_body> res;
    http::read(*stream, buffer, res);
    EXPECT_EQ(res.result(), http::status::ok) << target;
    EXPECT_EQ(res.body(), R"({"names":[],"sizes_by_name":{}})") << target;
  }
  EXPECT_EQ(shutdown_calls, 0);
}

TEST_F(HttpServerTest, ExpectContinueUpload) {
  start_server();
  auto stream = connect();

  auto req = make_upload({{"continued.txt", "after the interim response"}});
  req.set(http::field::expect, "100-continue");

  http::request_serializer<http::string_body> serializer{req};
  http::write_header(*stream, serializer);

  beast::flat_buffer buffer;
  http::response<http::empty_body> interim;
  http::read(*stream, buffer, interim);
  EXPECT_EQ(interim.result(), http::status::continue_);

  http::write(*stream, serializer);
  http::response<http::string_body> res;
  http::read(*stream, buffer, res);
  EXPECT_EQ(res.result(), http::status::found);
  EXPECT_EQ(read_file(test_dir / "continued.txt"), "after the interim response");
}

TEST_F(HttpServerTest, OversizedBodyIsRejected) {
  start_server();
  auto stream = connect();

  // Only the header is sent, the declared length alone exceeds the limit
  auto req = make_request(http::verb::post, "/shutdown");
  req.content_length(web::HttpSession::MAX_BODY_BYTES + 1);
  http::request_serializer<http::string_body> serializer{req};
  http::write_header(*stream, serializer);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(*stream, buffer, res);
  EXPECT_EQ(res.result(), http::status::payload_too_large);
  EXPECT_EQ(shutdown_calls, 0);
}

TEST_F(HttpServerTest, ShutdownRouteCallsHook) {
  start_server();
  const auto res = send(make_request(http::verb::post, "/shutdown"));
  EXPECT_EQ(res.body(), "Shutting down...");
  EXPECT_EQ(shutdown_calls, 1);
}

TEST_F(HttpServerTest, ConnectionLimitAnswers503) {
  config.max_connections = 1;
  start_server();

  // Held open with keep-alive so it keeps its slot
  auto first = connect();
  auto req = make_request(http::verb::get, "/", true);
  EXPECT_EQ(exchange(*first, req).result(), http::status::ok);

  const auto rejected = send(make_request(http::verb::get, "/"));
  EXPECT_EQ(rejected.result(), http::status::service_unavailable);

  beast::error_code ec;
  first->socket().shutdown(tcp::socket::shutdown_both, ec);
  first->close();
  ASSERT_TRUE(wait_for_sessions(0));

  EXPECT_EQ(send(make_request(http::verb::get, "/")).result(), http::status::ok);
}

TEST_F(HttpServerTest, ShutdownClosesIdleConnections) {
  start_server();
  auto idle = connect();
  auto req = make_request(http::verb::get, "/", true);
  EXPECT_EQ(exchange(*idle, req).result(), http::status::ok);

  const auto started = std::chrono::steady_clock::now();
  server->shutdown(std::chrono::milliseconds(5000));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  // Idle connections do not hold up the drain
  EXPECT_LT(elapsed, std::chrono::milliseconds(4000));
  EXPECT_TRUE(closed_by_server(*idle));
  EXPECT_FALSE(server->is_running());
}

TEST_F(HttpServerTest, ShutdownLetsInFlightUploadFinish) {
  start_server();
  auto stream = connect();

  auto req = make_upload({{"late.txt", "finished during shutdown"}});
  http::request_serializer<http::string_body> serializer{req};
  http::write_header(*stream, serializer);
  // Server is now reading the body of an upload
  ASSERT_TRUE(wait_for_spool());

  auto drained = std::async(std::launch::async, [this]() {
    server->shutdown(std::chrono::milliseconds(5000));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  http::write(*stream, serializer);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(*stream, buffer, res);

  EXPECT_EQ(res.result(), http::status::found);
  EXPECT_FALSE(res.keep_alive());
  EXPECT_EQ(drained.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(read_file(test_dir / "late.txt"), "finished during shutdown");
}

TEST_F(HttpServerTest, ShutdownTimeoutForcesStop) {
  start_server();
  auto stream = connect();

  // Upload that never completes
  auto req = make_upload({{"stuck.txt", "never sent"}});
  http::request_serializer<http::string_body> serializer{req};
  http::write_header(*stream, serializer);
  ASSERT_TRUE(wait_for_spool());

  const auto started = std::chrono::steady_clock::now();
  server->shutdown(std::chrono::milliseconds(300));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_GE(elapsed, std::chrono::milliseconds(300));
  EXPECT_FALSE(server->is_running());

  // The abandoned spool file is gone once the server is released
  server.reset();
  EXPECT_TRUE(raw_entries().empty());
}
