#pragma once

#include <optional>
#include <string>

namespace wxmcp::backend {

// BackendConfig holds a parsed and validated weather backend base URL.
//
// URL formats accepted:
//   http://host:port
//   http://host          (port defaults to 80)
//   http://host:port/    (a single trailing slash is tolerated)
struct BackendConfig {
  std::string url;   // NOLINT(readability-identifier-naming)
  std::string host;  // NOLINT(readability-identifier-naming)
  int port{80};      // NOLINT(readability-identifier-naming)
};

// parse_backend_url attempts to parse a backend base URL.
// Returns BackendConfig on success, nullopt if the format is not recognised.
//
// Rejects: empty string, any scheme other than http://, missing host,
// invalid port, and any path beyond a single "/".
[[nodiscard]] std::optional<BackendConfig> parse_backend_url(const std::string& url);

// backend_config_to_log_string returns "host:port" for diagnostics and
// operator-facing error messages.
[[nodiscard]] std::string backend_config_to_log_string(const BackendConfig& config);

}  // namespace wxmcp::backend
