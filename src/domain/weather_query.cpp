#include "wxmcp/domain/weather_query.h"

namespace wxmcp::domain {

std::optional<WeatherQuery> weather_query_from_json(const nlohmann::json& arguments) {
  if (!arguments.is_object()) {
    return std::nullopt;
  }

  const auto it = arguments.find("cities");
  if (it == arguments.end() || !it->is_array()) {
    return std::nullopt;
  }

  WeatherQuery query;
  for (const auto& city : *it) {
    if (!city.is_string()) {
      return std::nullopt;
    }
    query.cities.push_back(city.get<std::string>());
  }
  return query;
}

}  // namespace wxmcp::domain
