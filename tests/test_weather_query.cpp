#include "wxmcp/domain/weather_query.h"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <string>

using namespace wxmcp::domain;
using json = nlohmann::json;

TEST_CASE("weather_query_from_json: cities in order", "[weather][query]") {
  const auto query =
      weather_query_from_json(json{{"cities", json::array({"Stockholm", "Gaza", "Paris"})}});
  REQUIRE(query.has_value());
  REQUIRE(query->cities.size() == 3);
  CHECK(query->cities[0] == "Stockholm");
  CHECK(query->cities[2] == "Paris");
}

TEST_CASE("weather_query_from_json: empty list is a valid query", "[weather][query]") {
  const auto query = weather_query_from_json(json{{"cities", json::array()}});
  REQUIRE(query.has_value());
  CHECK(query->cities.empty());
}

TEST_CASE("weather_query_from_json: no length limit is applied", "[weather][query]") {
  json cities = json::array();
  for (std::size_t i = 0; i < kMaxCitiesPerQuery + 5; ++i) {
    cities.push_back("city" + std::to_string(i));
  }
  const auto query = weather_query_from_json(json{{"cities", cities}});
  REQUIRE(query.has_value());
  CHECK(query->cities.size() == kMaxCitiesPerQuery + 5);
}

TEST_CASE("weather_query_from_json: malformed arguments", "[weather][query]") {
  CHECK_FALSE(weather_query_from_json(json::object()).has_value());
  CHECK_FALSE(weather_query_from_json(json{{"cities", "Paris"}}).has_value());
  CHECK_FALSE(weather_query_from_json(json{{"cities", json::array({"Paris", 3})}}).has_value());
  CHECK_FALSE(weather_query_from_json(json::array()).has_value());
}
