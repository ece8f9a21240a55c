#pragma once

#include "wxmcp/backend/backend_config.h"
#include "wxmcp/backend/http_client.h"

#include "config.h"
#include <ostream>

namespace wxmcp::mcp {

// ServerContext holds all process-lifetime references passed to every handler.
// All references must remain valid for the lifetime of run_server_loop().
// log is the diagnostic side channel; nothing written there is part of the protocol.
struct ServerContext {
  const BridgeConfig& config;                    // NOLINT(readability-identifier-naming)
  const backend::BackendConfig& backend_config;  // NOLINT(readability-identifier-naming)
  backend::IHttpClient& http_client;             // NOLINT(readability-identifier-naming)
  std::ostream& log;                             // NOLINT(readability-identifier-naming)
};

}  // namespace wxmcp::mcp
