#include "wxmcp/backend/backend_health.h"
#include "wxmcp/backend/beast_http_client.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <utility>

using namespace wxmcp::backend;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Reserve an ephemeral port and release it so nothing is listening there.
int closed_local_port() {
  net::io_context ioc;
  tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  const int port = acceptor.local_endpoint().port();
  acceptor.close();
  return port;
}

// OneShotServer accepts a single connection, records the request and answers
// with a fixed status and body.
class OneShotServer {
 public:
  OneShotServer(http::status status, std::string body)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        status_(status),
        body_(std::move(body)),
        port_(acceptor_.local_endpoint().port()) {
    thread_ = std::thread([this] { serve(); });
  }

  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  OneShotServer(const OneShotServer&) = delete;
  OneShotServer& operator=(const OneShotServer&) = delete;

  [[nodiscard]] int port() const { return port_; }

  // Valid after join().
  void join() { thread_.join(); }
  [[nodiscard]] const std::string& method() const { return method_; }
  [[nodiscard]] const std::string& target() const { return target_; }
  [[nodiscard]] const std::string& content_type() const { return content_type_; }
  [[nodiscard]] const std::string& request_body() const { return request_body_; }

 private:
  void serve() {
    beast::error_code ec;
    tcp::socket socket(ioc_);
    acceptor_.accept(socket, ec);
    if (ec) {
      return;
    }

    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
      return;
    }
    method_ = std::string(req.method_string().data(), req.method_string().size());
    target_ = std::string(req.target().data(), req.target().size());
    const auto type = req[http::field::content_type];
    content_type_ = std::string(type.data(), type.size());
    request_body_ = req.body();

    http::response<http::string_body> res{status_, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = body_;
    res.prepare_payload();
    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  http::status status_;
  std::string body_;
  int port_;
  std::thread thread_;

  std::string method_;
  std::string target_;
  std::string content_type_;
  std::string request_body_;
};

// SilentServer accepts a single connection, reads the request and never
// answers. It returns once the client gives up and closes its end.
class SilentServer {
 public:
  SilentServer()
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        port_(acceptor_.local_endpoint().port()) {
    thread_ = std::thread([this] { serve(); });
  }

  ~SilentServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  SilentServer(const SilentServer&) = delete;
  SilentServer& operator=(const SilentServer&) = delete;

  [[nodiscard]] int port() const { return port_; }

 private:
  void serve() {
    beast::error_code ec;
    tcp::socket socket(ioc_);
    acceptor_.accept(socket, ec);
    if (ec) {
      return;
    }

    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
      return;
    }

    // Blocks until the client closes the connection.
    char byte = 0;
    socket.read_some(net::buffer(&byte, 1), ec);
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  int port_;
  std::thread thread_;
};

BackendConfig local_backend(int port) {
  return BackendConfig{"http://127.0.0.1:" + std::to_string(port), "127.0.0.1", port};
}

}  // namespace

// ── Connection failures ─────────────────────────────────────────────────────

TEST_CASE("BeastHttpClient: no listener is a connection failure", "[backend][http]") {
  BeastHttpClient client(local_backend(closed_local_port()));

  const auto result = client.post_json("/mcp/tool/weather_info", R"({"cities":["Paris"]})",
                                       std::chrono::seconds(2));
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == HttpErrorKind::kConnectionFailed);
  CHECK_FALSE(result.error().message.empty());
}

TEST_CASE("probe_backend: no listener reports unreachable without status", "[backend][health]") {
  BeastHttpClient client(local_backend(closed_local_port()));

  const auto health = probe_backend(client, std::chrono::seconds(2));
  CHECK_FALSE(health.reachable);
  CHECK(health.status == 0);
  CHECK_FALSE(health.error.empty());
}

TEST_CASE("BeastHttpClient: unresolvable host is a connection failure", "[backend][http]") {
  BeastHttpClient client(BackendConfig{"http://weather.invalid:3000", "weather.invalid", 3000});

  const auto result = client.get("/mcp", std::chrono::seconds(2));
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == HttpErrorKind::kConnectionFailed);
  CHECK(result.error().message.rfind("resolve: ", 0) == 0);
}

// ── Deadlines ───────────────────────────────────────────────────────────────

TEST_CASE("BeastHttpClient: backend that never replies is a timeout", "[backend][http]") {
  SilentServer server;
  BeastHttpClient client(local_backend(server.port()));

  const auto started = std::chrono::steady_clock::now();
  const auto result = client.post_json("/mcp/tool/weather_info", R"({"cities":["Paris"]})",
                                       std::chrono::seconds(1));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == HttpErrorKind::kTimeout);
  CHECK(result.error().message.rfind("read: ", 0) == 0);
  CHECK(elapsed < std::chrono::seconds(5));
}

// ── Round trips against a local server ──────────────────────────────────────

TEST_CASE("BeastHttpClient: POST sends JSON body and returns status and body",
          "[backend][http]") {
  OneShotServer server(http::status::not_found, R"({"error": "city not found"})");
  BeastHttpClient client(local_backend(server.port()));

  const auto result = client.post_json("/mcp/tool/weather_info", R"({"cities":["Atlantis"]})",
                                       std::chrono::seconds(5));
  server.join();

  REQUIRE(result.has_value());
  CHECK(result.value().status == 404);
  CHECK(result.value().body == R"({"error": "city not found"})");

  CHECK(server.method() == "POST");
  CHECK(server.target() == "/mcp/tool/weather_info");
  CHECK(server.content_type() == "application/json");
  CHECK(server.request_body() == R"({"cities":["Atlantis"]})");
}

TEST_CASE("probe_backend: 200 from GET /mcp is reachable", "[backend][health]") {
  OneShotServer server(http::status::ok, R"({"status": "ok"})");
  BeastHttpClient client(local_backend(server.port()));

  const auto health = probe_backend(client, std::chrono::seconds(5));
  server.join();

  CHECK(health.reachable);
  CHECK(health.status == 200);
  CHECK(server.method() == "GET");
  CHECK(server.target() == "/mcp");
}

TEST_CASE("probe_backend: non-200 is reported with its status", "[backend][health]") {
  OneShotServer server(http::status::service_unavailable, "");
  BeastHttpClient client(local_backend(server.port()));

  const auto health = probe_backend(client, std::chrono::seconds(5));
  server.join();

  CHECK_FALSE(health.reachable);
  CHECK(health.status == 503);
}
