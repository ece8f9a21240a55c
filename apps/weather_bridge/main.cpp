#include "wxmcp/backend/backend_config.h"
#include "wxmcp/backend/backend_health.h"
#include "wxmcp/backend/beast_http_client.h"
#include "wxmcp/core/version.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <chrono>
#include <iostream>
#include <string>

using namespace wxmcp;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto parsed = mcp::parse_args(argc, argv);

  if (parsed.help_requested) {
    std::cout << mcp::bridge_usage(argv[0]);
    return 0;
  }

  for (const auto& warning : parsed.warnings) {
    std::cerr << "WARNING: " << warning << " (ignored)\n";
  }

  if (!parsed.errors.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    std::cerr << mcp::bridge_usage(argv[0]);
    return 1;
  }

  const mcp::BridgeConfig& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_bridge_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // Guaranteed to parse: validated above.
  const backend::BackendConfig backend_config =
      backend::parse_backend_url(config.backend_url).value();

  // ── Startup diagnostic block ──────────────────────────────────────────────
  // stdout carries the protocol; every diagnostic goes to stderr.
  std::cerr << core::kServerName << " v" << core::kBuildVersion << "\n";
  std::cerr << "Backend:     " << backend::backend_config_to_log_string(backend_config) << "\n";

  backend::BeastHttpClient http_client(backend_config);

  if (config.probe) {
    const auto health =
        backend::probe_backend(http_client, std::chrono::seconds(config.probe_timeout_seconds));
    if (health.reachable) {
      std::cerr << "Connected to weather backend at "
                << backend::backend_config_to_log_string(backend_config) << "\n";
    } else if (health.status != 0) {
      std::cerr << "WARNING: Weather backend returned unexpected status " << health.status
                << " from GET " << backend::kHealthPath << "\n";
    } else {
      std::cerr << "WARNING: Cannot connect to weather backend on port " << backend_config.port
                << " (" << health.error << ").\n"
                << "         Tool calls will fail until the backend server is started.\n";
    }
  } else {
    std::cerr << "Backend probe skipped (--no-probe)\n";
  }

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  mcp::ServerContext ctx{config, backend_config, http_client, std::cerr};
  mcp::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
