#pragma once

#include <nlohmann/json.hpp>

#include "../method_handlers.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace wxmcp::mcp::handlers {

// A tool handler receives the "arguments" object of a tools/call request.
using ToolHandler =
    std::function<HandlerResult(const nlohmann::json& arguments, ServerContext& ctx)>;

std::unordered_map<std::string, ToolHandler> build_tool_registry();

}  // namespace wxmcp::mcp::handlers
