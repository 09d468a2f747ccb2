/**
 * @file series_builder.hpp
 * @brief Column-oriented hourly channels to a default-filled weather series.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "solarcast/core/config.hpp"
#include "solarcast/core/types.hpp"

namespace solarcast::weather {

/**
 * @brief Hourly channels as delivered by the weather provider, index-aligned with `time`.
 *
 * A channel shorter than `time`, or an absent element, means "not delivered" for that hour.
 */
struct HourlyChannels {
  std::vector<std::string> time{};
  std::vector<std::optional<double>> temperature_2m{};
  std::vector<std::optional<double>> cloud_cover{};
  std::vector<std::optional<double>> shortwave_radiation{};
  std::vector<std::optional<double>> relative_humidity_2m{};
  std::vector<std::optional<double>> wind_speed_10m{};
  std::vector<std::optional<double>> wind_direction_10m{};
  std::vector<std::optional<double>> surface_pressure{};
  std::vector<std::optional<double>> precipitation{};
  std::vector<std::optional<double>> uv_index{};
  std::vector<std::optional<double>> visibility{};
};

/**
 * @brief Outcome of series construction.
 */
struct SeriesBuildResult {
  solarcast::core::WeatherSeries series{};
  std::size_t filled_values{};
  solarcast::core::Status status{solarcast::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Build a time-sorted series, filling required channels from `defaults`.
 *
 * Non-finite values count as absent. An unparsable timestamp fails the whole build with
 * `Status::InvalidInput` and names the offending row in `message`.
 */
[[nodiscard]] SeriesBuildResult build_weather_series(const HourlyChannels& channels,
                                                     const solarcast::core::SeriesDefaults& defaults = {});

}  // namespace solarcast::weather
