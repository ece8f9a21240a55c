#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace wxmcp::mcp {

// A method handler produces either the "result" payload or the error to send back.
using HandlerResult = core::Result<nlohmann::json, JsonRpcError>;
using MethodHandler = std::function<HandlerResult(const JsonRpcRequest& req, ServerContext& ctx)>;

// Notification handlers never produce a response.
using NotificationHandler = std::function<void(const JsonRpcRequest& req, ServerContext& ctx)>;

struct MethodRegistry {
  std::unordered_map<std::string, MethodHandler> methods;  // NOLINT(readability-identifier-naming)
  std::unordered_map<std::string, NotificationHandler>
      notifications;  // NOLINT(readability-identifier-naming)
};

HandlerResult handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
HandlerResult handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);
HandlerResult handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);
HandlerResult handle_ping(const JsonRpcRequest& req, ServerContext& ctx);
void handle_initialized_notification(const JsonRpcRequest& req, ServerContext& ctx);

MethodRegistry build_method_registry();

// dispatch_request runs one request through the registry.
// Returns the response line to write, or nullopt for notifications.
// Never throws: a handler exception becomes an internal error response.
[[nodiscard]] std::optional<std::string> dispatch_request(const JsonRpcRequest& req,
                                                          const MethodRegistry& registry,
                                                          ServerContext& ctx);

}  // namespace wxmcp::mcp
