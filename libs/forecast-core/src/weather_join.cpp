/**
 * @file weather_join.cpp
 * @brief Timestamp join implementation.
 * @author Watosn
 */

#include "solarcast/forecast/weather_join.hpp"

#include <algorithm>
#include <cmath>

#include "solarcast/core/time_utils.hpp"

namespace solarcast::forecast {
namespace {

constexpr double kSameInstantToleranceS = 1e-6;
constexpr double kBandLowWeight = 0.5;
constexpr double kBandHighWeight = 0.3;

}  // namespace

std::optional<solarcast::core::WeatherSample> find_sample(const solarcast::core::WeatherSeries& series,
                                                          const solarcast::core::Epoch& epoch) {
  const double t = epoch.utc_seconds;
  const auto it = std::lower_bound(series.samples.begin(), series.samples.end(), t - kSameInstantToleranceS,
                                   [](const solarcast::core::WeatherSample& s, double ts) {
                                     return s.epoch.utc_seconds < ts;
                                   });
  if (it == series.samples.end() || std::abs(it->epoch.utc_seconds - t) > kSameInstantToleranceS) {
    return std::nullopt;
  }
  return *it;
}

std::optional<solarcast::core::WeatherSample> find_sample(const solarcast::core::WeatherSeries& series,
                                                          const std::string_view time) {
  solarcast::core::Epoch epoch{};
  if (!solarcast::core::parse_iso8601_utc(time, &epoch)) {
    return std::nullopt;
  }
  return find_sample(series, epoch);
}

std::vector<JoinedHour> join_forecast_with_weather(const std::vector<ForecastPoint>& points,
                                                   const solarcast::core::WeatherSeries& series) {
  std::vector<JoinedHour> out;
  out.reserve(points.size());
  for (const auto& p : points) {
    JoinedHour j{.point = p, .weather = find_sample(series, p.epoch)};
    const double slack = 1.0 - p.confidence;
    j.confidence_low_w_m2 = p.predicted_irradiance_w_m2 * (1.0 - slack * kBandLowWeight);
    j.confidence_high_w_m2 = p.predicted_irradiance_w_m2 * (1.0 + slack * kBandHighWeight);
    if (j.weather.has_value() && j.weather->shortwave_w_m2 > 0.0) {
      j.efficiency_pct = std::clamp(p.predicted_irradiance_w_m2 / j.weather->shortwave_w_m2 * 100.0, 0.0, 100.0);
    }
    out.push_back(std::move(j));
  }
  return out;
}

}  // namespace solarcast::forecast
