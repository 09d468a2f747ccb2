/**
 * @file series_builder.cpp
 * @brief Weather series construction implementation.
 * @author Watosn
 */

#include "solarcast/weather/series_builder.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "solarcast/core/time_utils.hpp"

namespace solarcast::weather {
namespace {

std::optional<double> channel_at(const std::vector<std::optional<double>>& channel, const std::size_t i) {
  if (i >= channel.size() || !channel[i].has_value() || !std::isfinite(*channel[i])) {
    return std::nullopt;
  }
  return channel[i];
}

double required_at(const std::vector<std::optional<double>>& channel, const std::size_t i, const double fallback,
                   std::size_t& filled) {
  const auto v = channel_at(channel, i);
  if (!v.has_value()) {
    ++filled;
    return fallback;
  }
  return *v;
}

}  // namespace

SeriesBuildResult build_weather_series(const HourlyChannels& channels, const solarcast::core::SeriesDefaults& defaults) {
  SeriesBuildResult out{};
  out.series.samples.reserve(channels.time.size());

  for (std::size_t i = 0; i < channels.time.size(); ++i) {
    solarcast::core::WeatherSample s{};
    s.time = channels.time[i];
    if (!solarcast::core::parse_iso8601_utc(s.time, &s.epoch)) {
      return SeriesBuildResult{.status = solarcast::core::Status::InvalidInput,
                               .message = fmt::format("row {}: unparsable timestamp '{}'", i, s.time)};
    }
    s.temperature_c = required_at(channels.temperature_2m, i, defaults.temperature_c, out.filled_values);
    s.cloud_cover_pct = required_at(channels.cloud_cover, i, defaults.cloud_cover_pct, out.filled_values);
    s.shortwave_w_m2 = required_at(channels.shortwave_radiation, i, defaults.shortwave_w_m2, out.filled_values);
    s.humidity_pct = channel_at(channels.relative_humidity_2m, i);
    s.wind_speed_mps = channel_at(channels.wind_speed_10m, i);
    s.wind_direction_deg = channel_at(channels.wind_direction_10m, i);
    s.pressure_hpa = channel_at(channels.surface_pressure, i);
    s.precipitation_mm = channel_at(channels.precipitation, i);
    s.uv_index = channel_at(channels.uv_index, i);
    s.visibility_m = channel_at(channels.visibility, i);
    out.series.samples.push_back(std::move(s));
  }

  std::stable_sort(out.series.samples.begin(), out.series.samples.end(),
                   [](const solarcast::core::WeatherSample& a, const solarcast::core::WeatherSample& b) {
                     return a.epoch.utc_seconds < b.epoch.utc_seconds;
                   });
  if (out.series.empty()) {
    out.status = solarcast::core::Status::DataUnavailable;
    out.message = "no hourly samples";
  }
  return out;
}

}  // namespace solarcast::weather
