/**
 * @file weather_analyzer.hpp
 * @brief One-shot trend, alert and quality analysis of a weather series.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>

#include "solarcast/analysis/weather_alerts.hpp"
#include "solarcast/analysis/weather_trends.hpp"
#include "solarcast/core/config.hpp"
#include "solarcast/core/types.hpp"

namespace solarcast::analysis {

/**
 * @brief Snapshot of sample 0 with display defaults for undelivered channels.
 */
struct CurrentConditions {
  double temperature_c{};
  double humidity_pct{50.0};
  double cloud_cover_pct{};
  double wind_speed_mps{};
  double wind_direction_deg{};
  double pressure_hpa{1013.0};
  double precipitation_mm{};
  std::optional<double> uv_index{};
  std::optional<double> visibility_m{};
};

/**
 * @brief Derived analysis of one weather series.
 */
struct WeatherAnalysis {
  CurrentConditions current{};
  WeatherTrends trends{};
  WeatherAlerts alerts{};
  double forecast_quality{};
  std::string data_freshness{"Real-time"};
};

/**
 * @brief Build the current-conditions snapshot from sample 0.
 */
[[nodiscard]] CurrentConditions current_conditions(const solarcast::core::WeatherSeries& series);

/**
 * @brief Runs trend, alert and quality estimators over a series.
 */
class WeatherAnalyzer final {
 public:
  WeatherAnalyzer() = default;
  explicit WeatherAnalyzer(const solarcast::core::AnalysisConfig& config) : config_(config) {}

  /**
   * @brief Analyze a series; empty or short series fall back to zero trends and the
   * degenerate quality score.
   */
  [[nodiscard]] WeatherAnalysis analyze(const solarcast::core::WeatherSeries& series) const;

 private:
  solarcast::core::AnalysisConfig config_{};
};

}  // namespace solarcast::analysis
