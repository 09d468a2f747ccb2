/**
 * @file weather_trends.hpp
 * @brief Least-squares trend estimation over weather channels.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "solarcast/core/types.hpp"

namespace solarcast::analysis {

/**
 * @brief Weather channels the analyzer can regress.
 */
enum class WeatherChannel : std::uint8_t {
  Temperature,
  CloudCover,
  WindSpeed,
  Pressure,
  Humidity,
  Precipitation
};

/**
 * @brief Per-hour slopes of the tracked channels (deg C/h, %/h, m/s/h, hPa/h, %/h).
 */
struct WeatherTrends {
  double temperature_per_h{};
  double cloud_cover_per_h{};
  double wind_speed_per_h{};
  double pressure_per_h{};
  double humidity_per_h{};
};

/**
 * @brief Value of `channel` at one sample; absent for undelivered optional channels.
 */
[[nodiscard]] std::optional<double> channel_value(const solarcast::core::WeatherSample& sample, WeatherChannel channel);

/**
 * @brief Ordinary least-squares slope of `y` against `x`.
 * @return 0 for fewer than two points, mismatched sizes or zero x-spread.
 */
[[nodiscard]] double least_squares_slope(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Population variance; 0 for an empty input.
 */
[[nodiscard]] double population_variance(const std::vector<double>& values);

/**
 * @brief Slope of one channel against sample index over the first `min(window, size)` samples.
 *
 * Samples missing the channel are skipped; a window of fewer than two samples gives 0.
 */
[[nodiscard]] double channel_trend(const solarcast::core::WeatherSeries& series, WeatherChannel channel,
                                   int window_samples = 24);

/**
 * @brief Trends of temperature, cloud cover, wind speed, pressure and humidity.
 */
[[nodiscard]] WeatherTrends analyze_trends(const solarcast::core::WeatherSeries& series, int window_samples = 24);

}  // namespace solarcast::analysis
