#pragma once

#include "wxmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace wxmcp::mcp {

// JSON-RPC 2.0 message types
//
// id is kept as the raw JSON value so strings, numbers and anything else the
// client chose round-trip untouched. nullopt means the request carried no id.
struct JsonRpcRequest {
  std::optional<nlohmann::json> id;  // NOLINT(readability-identifier-naming)
  std::string method;                // NOLINT(readability-identifier-naming)
  nlohmann::json params;             // NOLINT(readability-identifier-naming)
};

struct JsonRpcError {
  int code;             // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

struct ParseError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

using ParseResult = core::Result<JsonRpcRequest, ParseError>;

// Error codes (JSON-RPC 2.0 spec)
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

// Parse one frame. The caller skips blank lines before calling.
// Not JSON, or JSON that is not an object, is a ParseError.
// A missing or non-string method parses as "", non-object params as {}.
[[nodiscard]] ParseResult parse_request(const std::string& json_str);

// Create JSON-RPC success response line (no trailing newline)
[[nodiscard]] std::string make_response(const std::optional<nlohmann::json>& id,
                                        const nlohmann::json& result);

// Create JSON-RPC error response line (no trailing newline)
[[nodiscard]] std::string make_error_response(const std::optional<nlohmann::json>& id,
                                              const JsonRpcError& error);

// tools/call parameters: {"name": str, "arguments": {...}}
struct ToolCallParams {
  std::optional<std::string> name;  // NOLINT(readability-identifier-naming)
  nlohmann::json arguments;         // NOLINT(readability-identifier-naming)
};

// arguments defaults to {} when absent or not an object.
[[nodiscard]] ToolCallParams parse_tool_call_params(const nlohmann::json& params);

}  // namespace wxmcp::mcp
