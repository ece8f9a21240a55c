#include "wxmcp/backend/backend_health.h"

#include <string>

namespace wxmcp::backend {

BackendHealthResult probe_backend(IHttpClient& client, std::chrono::seconds timeout) {
  const auto result = client.get(kHealthPath, timeout);
  if (!result.has_value()) {
    return BackendHealthResult{false, 0, result.error().message};
  }

  const int status = result.value().status;
  if (status != 200) {
    return BackendHealthResult{false, status, "unexpected status " + std::to_string(status)};
  }
  return BackendHealthResult{true, status, ""};
}

}  // namespace wxmcp::backend
