#include "wxmcp/domain/weather_report.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace wxmcp::domain {

namespace {

// ordered_json keeps the backend's key order for "results".
using ordered_json = nlohmann::ordered_json;

constexpr int kRuleWidth = 60;

WeatherReportResult missing(const std::string& field) {
  return WeatherReportResult::err(
      DecodeError{"backend response has missing or invalid field '" + field + "'"});
}

bool read_number(const ordered_json& j, const char* key, double& out) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return false;
  }
  out = it->get<double>();
  return true;
}

bool read_string(const ordered_json& j, const char* key, std::string& out) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

}  // namespace

WeatherReportResult decode_weather_report(const std::string& body) {
  ordered_json j;
  try {
    j = ordered_json::parse(body);
  } catch (const ordered_json::parse_error& e) {
    return WeatherReportResult::err(DecodeError{std::string("invalid backend JSON: ") + e.what()});
  }

  if (!j.is_object()) {
    return WeatherReportResult::err(DecodeError{"backend response is not a JSON object"});
  }

  WeatherReport report;
  if (!read_string(j, "timestamp", report.timestamp)) {
    return missing("timestamp");
  }

  const auto results = j.find("results");
  if (results == j.end() || !results->is_object()) {
    return missing("results");
  }

  for (const auto& [city, info] : results->items()) {
    if (!info.is_object()) {
      return missing("results." + city);
    }

    CityWeather weather;
    weather.city = city;
    if (!read_number(info, "temperature", weather.temperature)) {
      return missing("results." + city + ".temperature");
    }
    if (!read_string(info, "condition", weather.condition)) {
      return missing("results." + city + ".condition");
    }
    if (!read_number(info, "humidity", weather.humidity)) {
      return missing("results." + city + ".humidity");
    }
    if (!read_number(info, "wind_speed", weather.wind_speed)) {
      return missing("results." + city + ".wind_speed");
    }
    report.cities.push_back(std::move(weather));
  }

  return WeatherReportResult::ok(std::move(report));
}

std::string format_number(double value) {
  if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream oss;
  oss << std::setprecision(15) << value;
  return oss.str();
}

std::string format_weather_report(const WeatherReport& report) {
  std::ostringstream out;
  out << "Weather Information (Retrieved: " << report.timestamp << ")\n";
  out << std::string(kRuleWidth, '=');

  for (const auto& weather : report.cities) {
    out << "\n\n\xF0\x9F\x8C\x8D " << weather.city << "\n";
    out << "   Temperature: " << format_number(weather.temperature) << "\xC2\xB0" "C\n";
    out << "   Condition: " << weather.condition << "\n";
    out << "   Humidity: " << format_number(weather.humidity) << "%\n";
    out << "   Wind Speed: " << format_number(weather.wind_speed) << " km/h";
  }

  return out.str();
}

}  // namespace wxmcp::domain
