#pragma once

#include "../shared/arg_parser.h"

#include <string>

namespace wxmcp::mcp {

constexpr const char* kDefaultBackendUrl = "http://localhost:3000";
constexpr int kDefaultTimeoutSeconds = 10;
constexpr int kDefaultProbeTimeoutSeconds = 2;

// BridgeConfig holds all parsed startup flags for the bridge.
// Every field has an explicit default; the values are fixed for the process lifetime.
struct BridgeConfig {
  std::string backend_url{kDefaultBackendUrl};             // NOLINT(readability-identifier-naming)
  int timeout_seconds{kDefaultTimeoutSeconds};             // NOLINT(readability-identifier-naming)
  int probe_timeout_seconds{kDefaultProbeTimeoutSeconds};  // NOLINT(readability-identifier-naming)
  bool probe{true};                                        // NOLINT(readability-identifier-naming)
};

// parse_args parses the bridge's flags on top of BridgeConfig defaults.
// Callers check errors and help_requested before using config.
apps::ParsedOptions<BridgeConfig> parse_args(int argc,
                                             char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Usage text for --help.
[[nodiscard]] std::string bridge_usage(const std::string& program);

}  // namespace wxmcp::mcp
