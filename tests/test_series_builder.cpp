/**
 * @file test_series_builder.cpp
 * @brief Weather series construction and default filling tests.
 * @author Watosn
 */

#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include "solarcast/weather/series_builder.hpp"

int main() {
  using namespace solarcast;

  weather::HourlyChannels ch{};
  ch.time = {"2024-06-21T02:00", "2024-06-21T00:00", "2024-06-21T01:00"};
  ch.temperature_2m = {18.0, std::nullopt, std::numeric_limits<double>::quiet_NaN()};
  ch.cloud_cover = {40.0, 10.0};  // shorter than time
  ch.shortwave_radiation = {0.0, 0.0, 0.0};
  ch.wind_speed_10m = {3.0, 4.0, 5.0};
  ch.surface_pressure = {1012.0, std::nullopt, 1010.0};

  const auto built = weather::build_weather_series(ch);
  if (built.status != core::Status::Ok || built.series.size() != 3U) {
    spdlog::error("series build failed: {}", built.message);
    return 1;
  }
  const auto& s = built.series;
  if (s[0].time != "2024-06-21T00:00" || s[1].time != "2024-06-21T01:00" || s[2].time != "2024-06-21T02:00" ||
      !(s[0].epoch.utc_seconds < s[1].epoch.utc_seconds)) {
    spdlog::error("series not sorted by time");
    return 2;
  }
  // Two temperatures (absent, NaN) and one cloud cover were defaulted.
  if (built.filled_values != 3U || s[0].temperature_c != 25.0 || s[1].temperature_c != 25.0 ||
      s[1].cloud_cover_pct != 0.0 || s[2].temperature_c != 18.0 || s[2].cloud_cover_pct != 40.0) {
    spdlog::error("default filling mismatch (filled={})", built.filled_values);
    return 3;
  }
  if (s[0].wind_speed_mps != 4.0 || s[0].pressure_hpa.has_value() || s[1].pressure_hpa != 1010.0 ||
      s[0].humidity_pct.has_value() || s[0].visibility_m.has_value()) {
    spdlog::error("optional channel handling mismatch");
    return 4;
  }

  const auto custom = weather::build_weather_series(ch, core::SeriesDefaults{.temperature_c = 10.0, .cloud_cover_pct = 50.0});
  if (custom.series[0].temperature_c != 10.0 || custom.series[1].cloud_cover_pct != 50.0) {
    spdlog::error("custom defaults not applied");
    return 5;
  }

  // Equal instants keep their input order.
  weather::HourlyChannels dup{};
  dup.time = {"2024-06-21T12:00:00Z", "2024-06-21T08:00:00-04:00"};
  dup.temperature_2m = {1.0, 2.0};
  const auto stable = weather::build_weather_series(dup);
  if (stable.series[0].temperature_c != 1.0 || stable.series[1].temperature_c != 2.0) {
    spdlog::error("sort is not stable");
    return 6;
  }

  weather::HourlyChannels broken = ch;
  broken.time[1] = "yesterday";
  const auto bad = weather::build_weather_series(broken);
  if (bad.status != core::Status::InvalidInput || !bad.series.empty() || bad.message.find("row 1") == std::string::npos) {
    spdlog::error("bad timestamp not reported: {}", bad.message);
    return 7;
  }

  const auto empty = weather::build_weather_series(weather::HourlyChannels{});
  if (empty.status != core::Status::DataUnavailable || !empty.series.empty()) {
    spdlog::error("empty channels not reported");
    return 8;
  }
  return 0;
}
