#pragma once

#include <nlohmann/json.hpp>

#include "../method_handlers.h"
#include "../server_context.h"
#include <string>

namespace wxmcp::mcp::handlers {

constexpr const char* kWeatherInfoTool = "weather_info";
constexpr const char* kWeatherInfoPath = "/mcp/tool/weather_info";

// handle_weather_info forwards the tool arguments verbatim to the backend and
// maps the outcome onto one result or error:
//
//   HTTP 200            -> {"content": [{"type": "text", "text": <report>}]}
//   HTTP <status>       -> error <status>, backend's "error" text or "HTTP request failed"
//   connection failure  -> error -32603 asking the operator to start the backend
//   anything else       -> error -32603 "Internal error: ..." (also logged)
//
// Exactly one attempt is made.
HandlerResult handle_weather_info(const nlohmann::json& arguments, ServerContext& ctx);

// Extracts the backend's {"error": "..."} message from a non-200 body.
[[nodiscard]] std::string backend_error_message(const std::string& body);

}  // namespace wxmcp::mcp::handlers
