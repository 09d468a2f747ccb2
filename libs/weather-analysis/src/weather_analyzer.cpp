/**
 * @file weather_analyzer.cpp
 * @brief Weather analysis implementation.
 * @author Watosn
 */

#include "solarcast/analysis/weather_analyzer.hpp"

#include "solarcast/analysis/forecast_quality.hpp"

namespace solarcast::analysis {

CurrentConditions current_conditions(const solarcast::core::WeatherSeries& series) {
  CurrentConditions out{};
  if (series.empty()) {
    return out;
  }
  const auto& s = series[0];
  out.temperature_c = s.temperature_c;
  out.cloud_cover_pct = s.cloud_cover_pct;
  out.humidity_pct = s.humidity_pct.value_or(out.humidity_pct);
  out.wind_speed_mps = s.wind_speed_mps.value_or(out.wind_speed_mps);
  out.wind_direction_deg = s.wind_direction_deg.value_or(out.wind_direction_deg);
  out.pressure_hpa = s.pressure_hpa.value_or(out.pressure_hpa);
  out.precipitation_mm = s.precipitation_mm.value_or(out.precipitation_mm);
  out.uv_index = s.uv_index;
  out.visibility_m = s.visibility_m;
  return out;
}

WeatherAnalysis WeatherAnalyzer::analyze(const solarcast::core::WeatherSeries& series) const {
  WeatherAnalysis out{};
  out.current = current_conditions(series);
  out.trends = analyze_trends(series, config_.window_samples);
  out.alerts = detect_alerts(series, out.trends, config_.alerts);
  out.forecast_quality = forecast_quality(series, config_);
  return out;
}

}  // namespace solarcast::analysis
