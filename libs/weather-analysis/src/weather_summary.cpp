/**
 * @file weather_summary.cpp
 * @brief Weather analysis text rendering.
 * @author Watosn
 */

#include "solarcast/analysis/weather_summary.hpp"

#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace solarcast::analysis {
namespace {

constexpr double kTemperatureDeadBandCph = 0.1;
constexpr double kCloudDeadBandPctph = 1.0;

const char* direction_word(const TrendDirection d) {
  switch (d) {
    case TrendDirection::Falling:
      return "falling";
    case TrendDirection::Rising:
      return "rising";
    case TrendDirection::Steady:
      break;
  }
  return "steady";
}

}  // namespace

TrendDirection trend_direction(const double slope, const double dead_band) {
  if (slope > dead_band) {
    return TrendDirection::Rising;
  }
  if (slope < -dead_band) {
    return TrendDirection::Falling;
  }
  return TrendDirection::Steady;
}

std::string format_weather_summary(const WeatherAnalysis& analysis) {
  const auto& c = analysis.current;
  const auto& t = analysis.trends;
  std::string out = fmt::format("Temp {:.1f} C | Cloud {:.0f}% | Humidity {:.0f}% | Wind {:.1f} m/s\n", c.temperature_c,
                                c.cloud_cover_pct, c.humidity_pct, c.wind_speed_mps);
  out += fmt::format("Forecast quality: {:.0f}%\n", analysis.forecast_quality * 100.0);
  out += fmt::format("Temp trend: {} {:+.2f} C/h\n", direction_word(trend_direction(t.temperature_per_h, kTemperatureDeadBandCph)),
                     t.temperature_per_h);
  out += fmt::format("Cloud trend: {} {:+.1f} %/h\n", direction_word(trend_direction(t.cloud_cover_per_h, kCloudDeadBandPctph)),
                     t.cloud_cover_per_h);

  std::vector<const char*> active;
  if (analysis.alerts.cloud_cover) {
    active.push_back("Heavy clouds");
  }
  if (analysis.alerts.temperature) {
    active.push_back("Extreme temp");
  }
  if (analysis.alerts.wind) {
    active.push_back("High wind");
  }
  if (analysis.alerts.pressure) {
    active.push_back("Pressure change");
  }
  if (analysis.alerts.precipitation) {
    active.push_back("Precipitation");
  }
  if (!active.empty()) {
    out += fmt::format("Alerts: {}\n", fmt::join(active, " | "));
  }
  return out;
}

}  // namespace solarcast::analysis
