/**
 * @file test_weather_trends.cpp
 * @brief Least-squares trend estimation tests.
 * @author Watosn
 */

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "solarcast/analysis/weather_trends.hpp"

namespace {

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace solarcast;
  using analysis::WeatherChannel;

  core::WeatherSeries series{};
  for (int i = 0; i < 30; ++i) {
    core::WeatherSample s{};
    // Linear over the first 24 samples, then a jump the window must ignore.
    s.temperature_c = i < 24 ? 12.0 + 0.75 * i : -50.0;
    s.cloud_cover_pct = 80.0 - 2.5 * i;
    s.wind_speed_mps = 5.0;
    s.humidity_pct = 60.0 + 0.5 * i;
    if (i % 2 == 0) {
      s.pressure_hpa = 1015.0 - 0.25 * i;
    }
    series.samples.push_back(s);
  }

  const auto t = analysis::analyze_trends(series);
  if (!approx_abs(t.temperature_per_h, 0.75, 1e-9) || !approx_abs(t.cloud_cover_per_h, -2.5, 1e-9) ||
      !approx_abs(t.wind_speed_per_h, 0.0, 1e-12) || !approx_abs(t.humidity_per_h, 0.5, 1e-9)) {
    spdlog::error("linear trend mismatch: temp={} cloud={} wind={} humidity={}", t.temperature_per_h,
                  t.cloud_cover_per_h, t.wind_speed_per_h, t.humidity_per_h);
    return 1;
  }
  // Pressure only delivered on even hours; slope is still per hour.
  if (!approx_abs(t.pressure_per_h, -0.25, 1e-9)) {
    spdlog::error("partial channel trend mismatch: {}", t.pressure_per_h);
    return 2;
  }

  if (!approx_abs(analysis::channel_trend(series, WeatherChannel::Temperature, 6), 0.75, 1e-9)) {
    spdlog::error("custom window mismatch");
    return 3;
  }
  if (analysis::channel_trend(series, WeatherChannel::Precipitation) != 0.0) {
    spdlog::error("absent channel should give a flat trend");
    return 4;
  }

  core::WeatherSeries one{};
  one.samples.push_back(core::WeatherSample{.temperature_c = 30.0});
  const auto flat = analysis::analyze_trends(one);
  if (flat.temperature_per_h != 0.0 || analysis::analyze_trends(core::WeatherSeries{}).cloud_cover_per_h != 0.0) {
    spdlog::error("short series should give zero slopes");
    return 5;
  }

  if (analysis::least_squares_slope({1.0, 1.0, 1.0}, {1.0, 2.0, 3.0}) != 0.0 ||
      analysis::least_squares_slope({0.0, 1.0}, {1.0}) != 0.0) {
    spdlog::error("degenerate regression guard failed");
    return 6;
  }
  if (!approx_abs(analysis::population_variance({1.0, 2.0, 3.0, 4.0}), 1.25, 1e-12) ||
      analysis::population_variance({}) != 0.0) {
    spdlog::error("population variance mismatch");
    return 7;
  }
  return 0;
}
