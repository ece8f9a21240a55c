#pragma once

#include "wxmcp/backend/http_client.h"

#include <chrono>
#include <string>

namespace wxmcp::backend {

// Path of the backend's liveness endpoint.
constexpr const char* kHealthPath = "/mcp";

// BackendHealthResult holds the outcome of a probe_backend() call.
// status is 0 when no HTTP response was received.
struct BackendHealthResult {
  bool reachable{false};  // NOLINT(readability-identifier-naming)
  int status{0};          // NOLINT(readability-identifier-naming)
  std::string error;      // NOLINT(readability-identifier-naming)
};

// probe_backend issues a single GET /mcp and reports whether the backend answered 200.
//
// Advisory only: the caller logs the outcome and starts regardless.
// Never throws: all errors are reported in BackendHealthResult.error.
[[nodiscard]] BackendHealthResult probe_backend(IHttpClient& client, std::chrono::seconds timeout);

}  // namespace wxmcp::backend
