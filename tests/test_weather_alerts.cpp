/**
 * @file test_weather_alerts.cpp
 * @brief Weather alert rule tests.
 * @author Watosn
 */

#include <initializer_list>

#include <spdlog/spdlog.h>

#include "solarcast/analysis/weather_alerts.hpp"

namespace {

solarcast::core::WeatherSeries cloud_series(std::initializer_list<double> cover) {
  solarcast::core::WeatherSeries s{};
  for (const double c : cover) {
    s.samples.push_back(solarcast::core::WeatherSample{.temperature_c = 20.0, .cloud_cover_pct = c});
  }
  return s;
}

}  // namespace

int main() {
  using namespace solarcast;

  const analysis::WeatherTrends calm{};

  const auto heavy = cloud_series({85.0, 85.0, 85.0});
  const auto a = analysis::detect_alerts(heavy, calm);
  if (!a.cloud_cover || a.temperature || a.wind || a.pressure || a.precipitation) {
    spdlog::error("heavy cloud alert mismatch");
    return 1;
  }

  const auto quiet = analysis::detect_alerts(cloud_series({20.0, 30.0, 40.0, 50.0, 60.0, 65.0}), calm);
  if (quiet.any()) {
    spdlog::error("quiet series raised an alert");
    return 2;
  }

  // 0 -> 60 within the first six hours.
  if (!analysis::detect_alerts(cloud_series({0.0, 10.0, 60.0, 10.0}), calm).cloud_cover) {
    spdlog::error("cloud variability alert missing");
    return 3;
  }
  // The jump after hour six is outside the variability window.
  if (analysis::detect_alerts(cloud_series({0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 90.0}), calm).cloud_cover) {
    spdlog::error("cloud variability window too wide");
    return 4;
  }

  auto s = cloud_series({20.0, 20.0});
  s.samples[0].temperature_c = -12.0;
  s.samples[0].wind_speed_mps = 22.0;
  s.samples[0].precipitation_mm = 6.0;
  const auto stormy = analysis::detect_alerts(s, calm);
  if (!stormy.temperature || !stormy.wind || !stormy.precipitation || stormy.cloud_cover) {
    spdlog::error("current-conditions alerts mismatch");
    return 5;
  }

  s.samples[0].temperature_c = 41.0;
  s.samples[0].wind_speed_mps.reset();
  s.samples[0].precipitation_mm = 5.0;
  const auto hot = analysis::detect_alerts(s, calm);
  if (!hot.temperature || hot.wind || hot.precipitation) {
    spdlog::error("threshold edges mismatch");
    return 6;
  }

  if (!analysis::detect_alerts(heavy, analysis::WeatherTrends{.pressure_per_h = -2.0}).pressure ||
      analysis::detect_alerts(heavy, analysis::WeatherTrends{.pressure_per_h = 1.5}).pressure) {
    spdlog::error("pressure trend alert mismatch");
    return 7;
  }
  // 1.504 reports as 1.50 and stays quiet; 1.506 reports as 1.51.
  if (analysis::detect_alerts(heavy, analysis::WeatherTrends{.pressure_per_h = 1.504}).pressure ||
      analysis::detect_alerts(heavy, analysis::WeatherTrends{.pressure_per_h = -1.504}).pressure ||
      !analysis::detect_alerts(heavy, analysis::WeatherTrends{.pressure_per_h = 1.506}).pressure ||
      !analysis::detect_alerts(core::WeatherSeries{}, analysis::WeatherTrends{.pressure_per_h = -1.506}).pressure) {
    spdlog::error("pressure trend not compared at reported precision");
    return 10;
  }

  const core::AlertThresholds strict{.cloud_cover_pct = 50.0, .wind_speed_mps = 10.0};
  s.samples[0].wind_speed_mps = 12.0;
  const auto custom = analysis::detect_alerts(cloud_series({60.0}), calm, strict);
  if (!custom.cloud_cover || !analysis::detect_alerts(s, calm, strict).wind) {
    spdlog::error("custom thresholds not applied");
    return 8;
  }

  const auto empty = analysis::detect_alerts(core::WeatherSeries{}, calm);
  if (empty.any()) {
    spdlog::error("empty series raised an alert");
    return 9;
  }
  return 0;
}
