/**
 * @file weather_alerts.hpp
 * @brief Threshold and variability alerts over a weather series.
 * @author Watosn
 */
#pragma once

#include "solarcast/analysis/weather_trends.hpp"
#include "solarcast/core/config.hpp"
#include "solarcast/core/types.hpp"

namespace solarcast::analysis {

/**
 * @brief Independent alert flags; "current" refers to sample 0.
 */
struct WeatherAlerts {
  bool cloud_cover{};
  bool temperature{};
  bool wind{};
  bool pressure{};
  bool precipitation{};

  [[nodiscard]] bool any() const { return cloud_cover || temperature || wind || pressure || precipitation; }
};

/**
 * @brief Evaluate alert rules.
 *
 * Cloud: current cover above threshold, or max-min spread over the first
 * `cloud_variability_window` samples above the variability threshold.
 * Temperature/wind/precipitation: current value outside limits (absent channels never alert).
 * Pressure: absolute pressure trend, rounded to 0.01 hPa/h, above threshold.
 */
[[nodiscard]] WeatherAlerts detect_alerts(const solarcast::core::WeatherSeries& series, const WeatherTrends& trends,
                                          const solarcast::core::AlertThresholds& thresholds = {});

}  // namespace solarcast::analysis
