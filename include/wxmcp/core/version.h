#pragma once

namespace wxmcp::core {

// kBuildVersion is the current software version string.
// Reported in the startup banner and in the initialize handshake.
constexpr const char* kBuildVersion = "0.3.0";

// kServerName is the name announced to MCP clients in serverInfo.
constexpr const char* kServerName = "weather-mcp-bridge";

}  // namespace wxmcp::core
