#pragma once

#include "wxmcp/core/result.h"

#include <chrono>
#include <string>

namespace wxmcp::backend {

// HttpErrorKind separates failures to reach the backend at all from failures
// that happen once a connection exists. Callers surface the two differently.
enum class HttpErrorKind {
  kConnectionFailed,  // NOLINT(readability-identifier-naming)
  kTimeout,           // NOLINT(readability-identifier-naming)
  kProtocol,          // NOLINT(readability-identifier-naming)
};

struct HttpError {
  HttpErrorKind kind{HttpErrorKind::kProtocol};  // NOLINT(readability-identifier-naming)
  std::string message;                           // NOLINT(readability-identifier-naming)
};

// HttpResponse is any response the backend produced, whatever its status.
struct HttpResponse {
  int status{0};     // NOLINT(readability-identifier-naming)
  std::string body;  // NOLINT(readability-identifier-naming)
};

using HttpResult = core::Result<HttpResponse, HttpError>;

// Abstract HTTP client for the weather backend.
// One call is one attempt: implementations never retry.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  // GET <target>. timeout bounds connect, write and read separately; name
  // resolution runs before the first deadline and is not bounded by it.
  [[nodiscard]] virtual HttpResult get(const std::string& target, std::chrono::seconds timeout) = 0;

  // POST <target> with Content-Type: application/json.
  [[nodiscard]] virtual HttpResult post_json(const std::string& target, const std::string& body,
                                             std::chrono::seconds timeout) = 0;

 protected:
  IHttpClient() = default;
  IHttpClient(const IHttpClient&) = default;
  IHttpClient& operator=(const IHttpClient&) = default;
  IHttpClient(IHttpClient&&) = default;
  IHttpClient& operator=(IHttpClient&&) = default;
};

}  // namespace wxmcp::backend
