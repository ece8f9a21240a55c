#include "method_handlers.h"

#include "wxmcp/core/version.h"
#include "wxmcp/domain/weather_query.h"

#include "handlers/tool_registry.h"
#include "handlers/weather_info.h"

#include <exception>
#include <string>

namespace wxmcp::mcp {

using json = nlohmann::json;

HandlerResult handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return HandlerResult::ok(json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", core::kServerName}, {"version", core::kBuildVersion}}},
  });
}

HandlerResult handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json tools = json::array();

  tools.push_back({
      {"name", handlers::kWeatherInfoTool},
      {"description", "Get weather information for specified cities from the weather backend"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"cities",
                 {{"type", "array"},
                  {"items", {{"type", "string"}}},
                  {"description", "List of city names (max " +
                                      std::to_string(domain::kMaxCitiesPerQuery) + ")"}}},
            }},
           {"required", json::array({"cities"})},
       }},
  });

  return HandlerResult::ok(json{{"tools", tools}});
}

HandlerResult handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  const ToolCallParams call = parse_tool_call_params(req.params);
  const std::string tool_name = call.name.value_or("");

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    return HandlerResult::err(JsonRpcError{kMethodNotFound, "Unknown tool: " + tool_name});
  }

  return it->second(call.arguments, ctx);
}

HandlerResult handle_ping(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return HandlerResult::ok(json::object());
}

void handle_initialized_notification(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  ctx.log << "Client initialized\n";
}

MethodRegistry build_method_registry() {
  MethodRegistry registry;
  registry.methods = {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
      {"ping", handle_ping},
  };
  registry.notifications = {
      {"notifications/initialized", handle_initialized_notification},
  };
  return registry;
}

std::optional<std::string> dispatch_request(const JsonRpcRequest& req,
                                            const MethodRegistry& registry, ServerContext& ctx) {
  try {
    if (auto note = registry.notifications.find(req.method); note != registry.notifications.end()) {
      note->second(req, ctx);
      return std::nullopt;
    }

    auto it = registry.methods.find(req.method);
    if (it == registry.methods.end()) {
      return make_error_response(req.id,
                                 JsonRpcError{kMethodNotFound, "Method not found: " + req.method});
    }

    const HandlerResult result = it->second(req, ctx);
    if (!result.has_value()) {
      return make_error_response(req.id, result.error());
    }
    return make_response(req.id, result.value());

  } catch (const std::exception& e) {
    ctx.log << "ERROR: Error processing request: " << e.what() << "\n";
    return make_error_response(
        req.id, JsonRpcError{kInternalError, std::string("Internal error: ") + e.what()});
  }
}

}  // namespace wxmcp::mcp
