/**
 * @file test_weather_analyzer.cpp
 * @brief Weather analyzer and text summary tests.
 * @author Watosn
 */

#include <cmath>
#include <string>

#include <spdlog/spdlog.h>

#include "solarcast/analysis/weather_analyzer.hpp"
#include "solarcast/analysis/weather_summary.hpp"

int main() {
  using namespace solarcast;

  core::WeatherSeries series{};
  for (int i = 0; i < 8; ++i) {
    core::WeatherSample s{.temperature_c = 10.0 + 1.0 * i, .cloud_cover_pct = 85.0};
    s.wind_speed_mps = 4.0;
    s.uv_index = 3.0;
    series.samples.push_back(s);
  }

  const analysis::WeatherAnalyzer analyzer{};
  const auto a = analyzer.analyze(series);
  if (a.current.temperature_c != 10.0 || a.current.humidity_pct != 50.0 || a.current.pressure_hpa != 1013.0 ||
      a.current.wind_speed_mps != 4.0 || a.current.uv_index != 3.0 || a.current.visibility_m.has_value()) {
    spdlog::error("current conditions mismatch");
    return 1;
  }
  if (std::abs(a.trends.temperature_per_h - 1.0) > 1e-9 || !a.alerts.cloud_cover || a.alerts.wind || a.data_freshness != "Real-time") {
    spdlog::error("analysis fields mismatch");
    return 2;
  }
  if (a.forecast_quality < 0.1 || a.forecast_quality > 0.99) {
    spdlog::error("quality out of bounds");
    return 3;
  }

  const auto empty = analyzer.analyze(core::WeatherSeries{});
  if (empty.forecast_quality != 0.5 || empty.alerts.any() || empty.trends.temperature_per_h != 0.0 ||
      empty.current.pressure_hpa != 1013.0) {
    spdlog::error("empty series fallback mismatch");
    return 4;
  }

  const std::string text = analysis::format_weather_summary(a);
  if (text.find("Temp 10.0 C | Cloud 85% | Humidity 50% | Wind 4.0 m/s") == std::string::npos ||
      text.find("Temp trend: rising +1.00 C/h") == std::string::npos ||
      text.find("Cloud trend: steady") == std::string::npos ||
      text.find("Alerts: Heavy clouds\n") == std::string::npos) {
    spdlog::error("summary text mismatch:\n{}", text);
    return 5;
  }
  if (analysis::format_weather_summary(empty).find("Alerts:") != std::string::npos) {
    spdlog::error("summary lists alerts for a quiet series");
    return 6;
  }

  if (analysis::trend_direction(-0.2, 0.1) != analysis::TrendDirection::Falling ||
      analysis::trend_direction(0.1, 0.1) != analysis::TrendDirection::Steady ||
      analysis::trend_direction(0.11, 0.1) != analysis::TrendDirection::Rising) {
    spdlog::error("trend direction mismatch");
    return 7;
  }
  return 0;
}
