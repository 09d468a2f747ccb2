/**
 * @file forecast_engine.cpp
 * @brief Forecast orchestration implementation.
 * @author Watosn
 */

#include "solarcast/forecast/forecast_engine.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "solarcast/irradiance/atmosphere_factors.hpp"
#include "solarcast/irradiance/clear_sky.hpp"
#include "solarcast/irradiance/confidence.hpp"

namespace solarcast::forecast {

solarcast::core::Status validate_location(const solarcast::core::GeoLocation& location, std::string* message) {
  auto fail = [message](std::string text) {
    if (message != nullptr) {
      *message = std::move(text);
    }
    return solarcast::core::Status::InvalidInput;
  };
  if (!std::isfinite(location.lat_deg) || !std::isfinite(location.lon_deg)) {
    return fail(fmt::format("non-finite coordinates ({}, {})", location.lat_deg, location.lon_deg));
  }
  if (location.lat_deg < -90.0 || location.lat_deg > 90.0) {
    return fail(fmt::format("latitude {} outside [-90, 90]", location.lat_deg));
  }
  if (location.lon_deg < -180.0 || location.lon_deg > 180.0) {
    return fail(fmt::format("longitude {} outside [-180, 180]", location.lon_deg));
  }
  return solarcast::core::Status::Ok;
}

ForecastPoint ForecastEngine::evaluate_hour(const solarcast::core::GeoLocation& location,
                                            const solarcast::core::WeatherSeries& series, const std::size_t index) const {
  if (index >= series.size()) {
    return ForecastPoint{.status = solarcast::core::Status::InvalidInput};
  }
  const auto& sample = series[index];
  ForecastPoint point{.time = sample.time, .epoch = sample.epoch};

  const auto pos = solarcast::solar::compute_solar_position(location, sample.epoch);
  point.breakdown.position = pos;
  if (pos.elevation_deg < 0.0) {
    point.predicted_irradiance_w_m2 = 0.0;
    point.confidence = std::clamp(config_.night_confidence, 0.1, 1.0);
    point.breakdown.night = true;
    return point;
  }

  auto& b = point.breakdown;
  b.clear_sky_ghi_w_m2 = solarcast::irradiance::clear_sky_ghi_w_m2(pos.elevation_deg, pos.zenith_deg);
  b.cloud_impact = solarcast::irradiance::cloud_impact_factor(sample.cloud_cover_pct, sample.temperature_c,
                                                                 config_.monotonic_cloud_cap);
  b.aerosol_factor = solarcast::irradiance::aerosol_transmission_factor(pos.elevation_deg);

  // Observed shortwave already carries the provider's cloud attenuation; it is scaled again here.
  b.predicted_ghi_w_m2 = std::max(0.0, sample.shortwave_w_m2 * b.cloud_impact * b.aerosol_factor);

  const double excess_c = std::max(0.0, sample.temperature_c - config_.reference_temperature_c);
  b.temperature_loss_factor = 1.0 + config_.temperature_coefficient_per_c * excess_c;

  const double predicted = b.predicted_ghi_w_m2 * config_.system_efficiency * b.temperature_loss_factor;
  point.predicted_irradiance_w_m2 = std::isfinite(predicted) ? std::max(0.0, predicted) : 0.0;

  b.components = solarcast::irradiance::decompose_irradiance(b.predicted_ghi_w_m2, pos.elevation_deg, sample.cloud_cover_pct);
  point.confidence = solarcast::irradiance::forecast_confidence(sample.cloud_cover_pct, pos.elevation_deg,
                                                                sample.temperature_c, index, series,
                                                                config_.night_confidence);
  return point;
}

ForecastResult ForecastEngine::forecast(const solarcast::core::GeoLocation& location,
                                        const solarcast::core::WeatherSeries& series) const {
  ForecastResult out{};
  out.status = validate_location(location, &out.message);
  if (out.status != solarcast::core::Status::Ok) {
    return out;
  }

  out.points.reserve(series.size());
  for (std::size_t i = 0; i < series.size(); ++i) {
    out.points.push_back(evaluate_hour(location, series, i));
  }
  return out;
}

}  // namespace solarcast::forecast
