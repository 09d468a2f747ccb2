/**
 * @file weather_alerts.cpp
 * @brief Weather alert rules implementation.
 * @author Watosn
 */

#include "solarcast/analysis/weather_alerts.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace solarcast::analysis {

WeatherAlerts detect_alerts(const solarcast::core::WeatherSeries& series, const WeatherTrends& trends,
                            const solarcast::core::AlertThresholds& thresholds) {
  WeatherAlerts out{};
  // Compare the trend as reported, to two decimals.
  const double pressure_trend = std::round(std::abs(trends.pressure_per_h) * 100.0) / 100.0;
  out.pressure = pressure_trend > thresholds.pressure_trend_hpa_per_h;
  if (series.empty()) {
    return out;
  }

  const auto& now = series[0];
  const std::size_t window =
      std::min(series.size(), static_cast<std::size_t>(std::max(thresholds.cloud_variability_window, 0)));
  double cloud_spread = 0.0;
  if (window > 1U) {
    const auto [lo, hi] = std::minmax_element(
        series.samples.begin(), series.samples.begin() + static_cast<std::ptrdiff_t>(window),
        [](const solarcast::core::WeatherSample& a, const solarcast::core::WeatherSample& b) {
          return a.cloud_cover_pct < b.cloud_cover_pct;
        });
    cloud_spread = hi->cloud_cover_pct - lo->cloud_cover_pct;
  }

  out.cloud_cover = now.cloud_cover_pct > thresholds.cloud_cover_pct || cloud_spread > thresholds.cloud_variability_pct;
  out.temperature = now.temperature_c < thresholds.temperature_low_c || now.temperature_c > thresholds.temperature_high_c;
  out.wind = now.wind_speed_mps.value_or(0.0) > thresholds.wind_speed_mps;
  out.precipitation = now.precipitation_mm.value_or(0.0) > thresholds.precipitation_mm;
  return out;
}

}  // namespace solarcast::analysis
