#include "tool_registry.h"

#include "weather_info.h"

namespace wxmcp::mcp::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {kWeatherInfoTool, handle_weather_info},
  };
}

}  // namespace wxmcp::mcp::handlers
