#include "wxmcp/backend/backend_config.h"

#include <string>
#include <string_view>

namespace wxmcp::backend {

std::optional<BackendConfig> parse_backend_url(const std::string& url) {
  if (url.empty()) {
    return std::nullopt;
  }

  std::string_view view{url};
  constexpr std::string_view kScheme{"http://"};
  if (!view.starts_with(kScheme)) {
    return std::nullopt;
  }

  std::string_view host_port_view = view.substr(kScheme.size());
  if (host_port_view.ends_with('/')) {
    host_port_view.remove_suffix(1);
  }

  if (host_port_view.empty() || host_port_view.find('/') != std::string_view::npos) {
    return std::nullopt;
  }

  // Split on last colon to separate host from port.
  const auto colon_pos = host_port_view.rfind(':');
  std::string host;
  int port = 80;

  if (colon_pos == std::string_view::npos) {
    host = std::string{host_port_view};
  } else {
    host = std::string{host_port_view.substr(0, colon_pos)};
    const std::string_view port_view = host_port_view.substr(colon_pos + 1);

    if (port_view.empty() || port_view.size() > 5) {
      return std::nullopt;
    }

    port = 0;
    for (const char c : port_view) {
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      port = port * 10 + (c - '0');
    }

    if (port < 1 || port > 65535) {
      return std::nullopt;
    }
  }

  // IPv6 literals ("[::1]") are not supported; any colon or bracket left in
  // the host means the authority was not a plain host[:port].
  if (host.empty() || host.find_first_of("[]:") != std::string::npos) {
    return std::nullopt;
  }

  return BackendConfig{url, host, port};
}

std::string backend_config_to_log_string(const BackendConfig& config) {
  return config.host + ":" + std::to_string(config.port);
}

}  // namespace wxmcp::backend
