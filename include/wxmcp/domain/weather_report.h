#pragma once

#include "wxmcp/core/result.h"

#include <string>
#include <vector>

namespace wxmcp::domain {

// CityWeather is one city's conditions as reported by the backend.
struct CityWeather {
  std::string city;       // NOLINT(readability-identifier-naming)
  double temperature{0};  // NOLINT(readability-identifier-naming) °C
  std::string condition;  // NOLINT(readability-identifier-naming)
  double humidity{0};     // NOLINT(readability-identifier-naming) %
  double wind_speed{0};   // NOLINT(readability-identifier-naming) km/h
};

// WeatherReport is the decoded success body of POST /mcp/tool/weather_info.
// cities keeps the order in which the backend listed them.
struct WeatherReport {
  std::string timestamp;            // NOLINT(readability-identifier-naming)
  std::vector<CityWeather> cities;  // NOLINT(readability-identifier-naming)
};

struct DecodeError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

using WeatherReportResult = core::Result<WeatherReport, DecodeError>;

/// Decode a backend success body: {"timestamp": str, "results": {city: {...}}}.
/// Any missing or mistyped field is a DecodeError; extra fields are ignored.
[[nodiscard]] WeatherReportResult decode_weather_report(const std::string& body);

/// Render the report as the multi-line text block returned to MCP clients.
[[nodiscard]] std::string format_weather_report(const WeatherReport& report);

/// Integral values print without a fractional part ("18"), others as-is ("18.5").
[[nodiscard]] std::string format_number(double value);

}  // namespace wxmcp::domain
