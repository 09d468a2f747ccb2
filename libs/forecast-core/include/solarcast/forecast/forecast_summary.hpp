/**
 * @file forecast_summary.hpp
 * @brief Aggregate statistics over a forecast and solar potential scoring.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include "solarcast/core/types.hpp"
#include "solarcast/forecast/forecast_engine.hpp"

namespace solarcast::forecast {

/**
 * @brief Summary statistics over a forecast sequence.
 */
struct ForecastSummary {
  double peak_irradiance_w_m2{};
  double mean_irradiance_w_m2{};
  double min_irradiance_w_m2{};
  double mean_confidence{};
  double estimated_energy_kwh_m2{};  // hourly cadence: sum(W/m^2) / 1000
  std::size_t daylight_hours{};
  std::size_t points{};
  solarcast::core::Status status{solarcast::core::Status::Ok};
};

/**
 * @brief Summarize a forecast; empty input gives zeros and `Status::DataUnavailable`.
 */
[[nodiscard]] ForecastSummary summarize_forecast(const std::vector<ForecastPoint>& points);

/**
 * @brief Solar potential score in [0, 100] from mean cloud cover and mean daytime shortwave.
 *
 * `round((100 - mean_cloud)/100 * min(1, mean_positive_shortwave/800) * 100)`; 0 when the series
 * has no positive shortwave value.
 */
[[nodiscard]] int solar_potential_score(const solarcast::core::WeatherSeries& series);

}  // namespace solarcast::forecast
