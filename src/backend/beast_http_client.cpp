#include "wxmcp/backend/beast_http_client.h"

#include "wxmcp/core/version.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace wxmcp::backend {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

HttpError make_error(HttpErrorKind kind, const std::string& phase, const beast::error_code& ec) {
  return HttpError{kind, phase + ": " + ec.message()};
}

// Once connected, a deadline expiry is a timeout; anything else is a protocol failure.
HttpErrorKind classify_io_error(const beast::error_code& ec) {
  return ec == beast::error::timeout ? HttpErrorKind::kTimeout : HttpErrorKind::kProtocol;
}

std::string host_header(const BackendConfig& config) {
  if (config.port == 80) {
    return config.host;
  }
  return config.host + ":" + std::to_string(config.port);
}

}  // namespace

HttpResult BeastHttpClient::get(const std::string& target, std::chrono::seconds timeout) {
  return perform(false, target, std::nullopt, timeout);
}

HttpResult BeastHttpClient::post_json(const std::string& target, const std::string& body,
                                      std::chrono::seconds timeout) {
  return perform(true, target, body, timeout);
}

HttpResult BeastHttpClient::perform(bool is_post, const std::string& target,
                                    const std::optional<std::string>& body,
                                    std::chrono::seconds timeout) {
  // tcp_stream deadlines only apply to asynchronous operations, so connect,
  // write and read are issued async and driven with run() on a private context.
  // Resolution stays synchronous: getaddrinfo cannot be abandoned mid-call.
  try {
    net::io_context ioc;
    beast::error_code ec;

    tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec) {
      return HttpResult::err(make_error(HttpErrorKind::kConnectionFailed, "resolve", ec));
    }

    beast::tcp_stream stream(ioc);
    stream.expires_after(timeout);
    stream.async_connect(endpoints,
                         [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
    ioc.run();
    if (ec) {
      return HttpResult::err(make_error(HttpErrorKind::kConnectionFailed, "connect", ec));
    }

    http::request<http::string_body> req{is_post ? http::verb::post : http::verb::get, target,
                                         11};
    req.set(http::field::host, host_header(config_));
    req.set(http::field::user_agent, std::string(core::kServerName) + "/" + core::kBuildVersion);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    if (body.has_value()) {
      req.set(http::field::content_type, "application/json");
      req.body() = body.value();
    }
    req.prepare_payload();

    stream.expires_after(timeout);
    ioc.restart();
    http::async_write(stream, req, [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    ioc.run();
    if (ec) {
      return HttpResult::err(make_error(classify_io_error(ec), "write", ec));
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(timeout);
    ioc.restart();
    http::async_read(stream, buffer, res,
                     [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    ioc.run();
    if (ec) {
      return HttpResult::err(make_error(classify_io_error(ec), "read", ec));
    }

    // not_connected is normal here: the backend closes first under Connection: close.
    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    return HttpResult::ok(HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())});
  } catch (const std::exception& e) {
    return HttpResult::err(HttpError{HttpErrorKind::kProtocol, e.what()});
  }
}

}  // namespace wxmcp::backend
