/**
 * @file types.hpp
 * @brief Core domain types for solarcast.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace solarcast::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DataUnavailable, NumericalError };

/**
 * @brief Human-readable status name for logs and CLI output.
 */
inline const char* status_name(const Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
  }
  return "unknown";
}

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief Geographic point on the Earth surface.
 */
struct GeoLocation {
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief One hour of weather forcing.
 *
 * Required channels are always populated (defaults are filled when the series is built);
 * optional channels are absent when the provider did not deliver them.
 */
struct WeatherSample {
  std::string time{};
  Epoch epoch{};
  double temperature_c{};
  double cloud_cover_pct{};
  double shortwave_w_m2{};
  std::optional<double> humidity_pct{};
  std::optional<double> wind_speed_mps{};
  std::optional<double> wind_direction_deg{};
  std::optional<double> pressure_hpa{};
  std::optional<double> precipitation_mm{};
  std::optional<double> uv_index{};
  std::optional<double> visibility_m{};
};

/**
 * @brief Hourly weather series ordered by ascending time.
 */
struct WeatherSeries {
  std::vector<WeatherSample> samples{};

  [[nodiscard]] std::size_t size() const { return samples.size(); }
  [[nodiscard]] bool empty() const { return samples.empty(); }
  [[nodiscard]] const WeatherSample& operator[](const std::size_t i) const { return samples[i]; }
};

}  // namespace solarcast::core
