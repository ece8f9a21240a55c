#include "weather_info.h"

#include "wxmcp/backend/backend_config.h"
#include "wxmcp/domain/weather_query.h"
#include "wxmcp/domain/weather_report.h"

#include <chrono>
#include <exception>
#include <string>

namespace wxmcp::mcp::handlers {

using json = nlohmann::json;

namespace {

constexpr const char* kGenericHttpFailure = "HTTP request failed";

HandlerResult internal_error(ServerContext& ctx, const std::string& what) {
  ctx.log << "ERROR: Error calling HTTP endpoint: " << what << "\n";
  return HandlerResult::err(JsonRpcError{kInternalError, "Internal error: " + what});
}

HandlerResult connection_error(const ServerContext& ctx) {
  return HandlerResult::err(JsonRpcError{
      kInternalError,
      "Cannot connect to weather backend at " +
          backend::backend_config_to_log_string(ctx.backend_config) +
          ". Please ensure the weather backend server is running on port " +
          std::to_string(ctx.backend_config.port) + "."});
}

}  // namespace

std::string backend_error_message(const std::string& body) {
  const json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return kGenericHttpFailure;
  }

  const auto it = j.find("error");
  if (it == j.end() || !it->is_string()) {
    return kGenericHttpFailure;
  }
  return it->get<std::string>();
}

HandlerResult handle_weather_info(const json& arguments, ServerContext& ctx) {
  try {
    if (const auto query = domain::weather_query_from_json(arguments); query.has_value()) {
      ctx.log << "weather_info request for " << query->cities.size() << " cities\n";
    } else {
      ctx.log << "weather_info request without a cities list; forwarding as-is\n";
    }

    const auto response = ctx.http_client.post_json(
        kWeatherInfoPath, arguments.dump(), std::chrono::seconds(ctx.config.timeout_seconds));

    if (!response.has_value()) {
      const auto& error = response.error();
      if (error.kind == backend::HttpErrorKind::kConnectionFailed) {
        ctx.log << "WARNING: Cannot connect to weather backend: " << error.message << "\n";
        return connection_error(ctx);
      }
      return internal_error(ctx, error.message);
    }

    const auto& http = response.value();
    if (http.status != 200) {
      return HandlerResult::err(JsonRpcError{http.status, backend_error_message(http.body)});
    }

    const auto report = domain::decode_weather_report(http.body);
    if (!report.has_value()) {
      return internal_error(ctx, report.error().message);
    }

    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", domain::format_weather_report(report.value())},
    });
    return HandlerResult::ok(json{{"content", content}});

  } catch (const std::exception& e) {
    return internal_error(ctx, e.what());
  }
}

}  // namespace wxmcp::mcp::handlers
