/**
 * @file weather_join.hpp
 * @brief Timestamp-keyed join between forecast points and a weather series.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "solarcast/core/types.hpp"
#include "solarcast/forecast/forecast_engine.hpp"

namespace solarcast::forecast {

/**
 * @brief Forecast hour paired with the weather sample observed at the same instant.
 */
struct JoinedHour {
  ForecastPoint point{};
  std::optional<solarcast::core::WeatherSample> weather{};
  std::optional<double> efficiency_pct{};  // predicted / observed shortwave, [0, 100]
  double confidence_low_w_m2{};
  double confidence_high_w_m2{};
};

/**
 * @brief Look up the sample whose timestamp denotes the same UTC instant as `epoch`.
 */
[[nodiscard]] std::optional<solarcast::core::WeatherSample> find_sample(const solarcast::core::WeatherSeries& series,
                                                                        const solarcast::core::Epoch& epoch);

/**
 * @brief Look up a sample by ISO-8601 timestamp text; absent when unparsable or unmatched.
 */
[[nodiscard]] std::optional<solarcast::core::WeatherSample> find_sample(const solarcast::core::WeatherSeries& series,
                                                                        std::string_view time);

/**
 * @brief Join every forecast point with the series by timestamp, never by position.
 *
 * The confidence band is `p*(1-(1-c)*0.5)` .. `p*(1+(1-c)*0.3)`.
 */
[[nodiscard]] std::vector<JoinedHour> join_forecast_with_weather(const std::vector<ForecastPoint>& points,
                                                                 const solarcast::core::WeatherSeries& series);

}  // namespace solarcast::forecast
