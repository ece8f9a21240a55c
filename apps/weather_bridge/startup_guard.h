#pragma once

#include "config.h"
#include <string>

namespace wxmcp::mcp {

// validate_bridge_config checks startup preconditions for the bridge.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - backend_url parses with parse_backend_url()
// - timeout_seconds > 0
// - probe_timeout_seconds > 0 (only when the probe is enabled)
[[nodiscard]] std::string validate_bridge_config(const BridgeConfig& config);

}  // namespace wxmcp::mcp
