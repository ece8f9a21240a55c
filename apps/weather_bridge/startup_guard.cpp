#include "startup_guard.h"

#include "wxmcp/backend/backend_config.h"

namespace wxmcp::mcp {

std::string validate_bridge_config(const BridgeConfig& config) {
  if (!backend::parse_backend_url(config.backend_url).has_value()) {
    return "Error: --backend URL '" + config.backend_url +
           "' is not a valid backend URL.\n"
           "       Accepted formats: http://host:port, http://host";
  }

  if (config.timeout_seconds <= 0) {
    return "Error: --timeout must be a positive number of seconds.";
  }

  if (config.probe && config.probe_timeout_seconds <= 0) {
    return "Error: --probe-timeout must be a positive number of seconds.\n"
           "       Pass --no-probe to skip the startup probe instead.";
  }

  return "";
}

}  // namespace wxmcp::mcp
