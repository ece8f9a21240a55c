#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wxmcp::domain {

// Advertised upper bound on cities per call. The backend enforces it; the
// bridge only publishes it in the tool schema.
constexpr std::size_t kMaxCitiesPerQuery = 20;

// WeatherQuery is the typed view of weather_info tool arguments: {"cities": [str, ...]}.
struct WeatherQuery {
  std::vector<std::string> cities;  // NOLINT(readability-identifier-naming)
};

/// Read a WeatherQuery from tool arguments.
/// Returns nullopt when "cities" is absent or not an array of strings.
[[nodiscard]] std::optional<WeatherQuery> weather_query_from_json(const nlohmann::json& arguments);

}  // namespace wxmcp::domain
