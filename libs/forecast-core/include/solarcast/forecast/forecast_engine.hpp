/**
 * @file forecast_engine.hpp
 * @brief Hour-by-hour irradiance forecast over a weather series.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "solarcast/core/config.hpp"
#include "solarcast/core/types.hpp"
#include "solarcast/irradiance/decomposition.hpp"
#include "solarcast/solar/solar_position.hpp"

namespace solarcast::forecast {

/**
 * @brief Intermediate model values behind one forecast hour.
 *
 * Night hours carry the solar position only; every factor stays 0.
 */
struct HourlyBreakdown {
  solarcast::solar::SolarPosition position{};
  double clear_sky_ghi_w_m2{};
  double cloud_impact{};
  double aerosol_factor{};
  double predicted_ghi_w_m2{};
  double temperature_loss_factor{};
  solarcast::irradiance::IrradianceComponents components{};
  bool night{};
};

/**
 * @brief One forecast hour.
 */
struct ForecastPoint {
  std::string time{};
  solarcast::core::Epoch epoch{};
  double predicted_irradiance_w_m2{};
  double confidence{};
  HourlyBreakdown breakdown{};
  solarcast::core::Status status{solarcast::core::Status::Ok};
};

/**
 * @brief Forecast sequence, index-aligned with the input series.
 */
struct ForecastResult {
  std::vector<ForecastPoint> points{};
  solarcast::core::Status status{solarcast::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Check that a location is finite and within [-90, 90] x [-180, 180].
 * @param message Receives a description of the problem when not Ok.
 */
[[nodiscard]] solarcast::core::Status validate_location(const solarcast::core::GeoLocation& location,
                                                        std::string* message = nullptr);

/**
 * @brief Composes solar position, clear-sky, cloud, aerosol, decomposition and confidence
 * models over an hourly series.
 *
 * The observed shortwave radiation (not the clear-sky value) is the base that cloud and aerosol
 * factors scale; the clear-sky figure only feeds the decomposition clearness index.
 */
class ForecastEngine final {
 public:
  ForecastEngine() = default;
  explicit ForecastEngine(const solarcast::core::ForecastConfig& config) : config_(config) {}

  /**
   * @brief Forecast every sample of `series` in order.
   *
   * Fails as a whole with `Status::InvalidInput` and no points when the location is invalid.
   */
  [[nodiscard]] ForecastResult forecast(const solarcast::core::GeoLocation& location,
                                        const solarcast::core::WeatherSeries& series) const;

  /**
   * @brief Evaluate one hour.
   *
   * An `index` past the end of `series` yields an empty point with `Status::InvalidInput`.
   */
  [[nodiscard]] ForecastPoint evaluate_hour(const solarcast::core::GeoLocation& location,
                                            const solarcast::core::WeatherSeries& series, std::size_t index) const;

  [[nodiscard]] const solarcast::core::ForecastConfig& config() const { return config_; }

 private:
  solarcast::core::ForecastConfig config_{};
};

}  // namespace solarcast::forecast
