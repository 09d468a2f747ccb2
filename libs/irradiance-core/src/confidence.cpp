/**
 * @file confidence.cpp
 * @brief Forecast confidence implementation.
 * @author Watosn
 */

#include "solarcast/irradiance/confidence.hpp"

#include <algorithm>
#include <cmath>

namespace solarcast::irradiance {
namespace {

constexpr double kCloudVarianceWeight = 0.4;
constexpr double kFullConfidenceElevationDeg = 80.0;
constexpr double kExtremeColdC = -10.0;
constexpr double kExtremeHeatC = 40.0;
constexpr double kExtremeTemperatureConfidence = 0.7;
constexpr double kNormalTemperatureConfidence = 0.9;
constexpr double kMinConfidence = 0.1;

}  // namespace

double forecast_confidence(const double /*cloud_cover_pct*/, const double elevation_deg, const double temperature_c,
                           const std::size_t index, const solarcast::core::WeatherSeries& series,
                           const double night_confidence) {
  if (elevation_deg < 0.0) {
    return std::clamp(night_confidence, kMinConfidence, 1.0);
  }

  double cloud_variance = 0.0;
  if (index > 0 && index + 1 < series.size()) {
    cloud_variance = std::abs(series[index - 1].cloud_cover_pct - series[index + 1].cloud_cover_pct) / 100.0;
  }

  const double cloud_confidence = 1.0 - kCloudVarianceWeight * cloud_variance;
  const double elevation_confidence = std::min(1.0, elevation_deg / kFullConfidenceElevationDeg);
  const double temperature_confidence = (temperature_c < kExtremeColdC || temperature_c > kExtremeHeatC)
                                            ? kExtremeTemperatureConfidence
                                            : kNormalTemperatureConfidence;

  const double c = cloud_confidence * elevation_confidence * temperature_confidence;
  if (!std::isfinite(c)) {
    return kMinConfidence;
  }
  return std::clamp(c, kMinConfidence, 1.0);
}

}  // namespace solarcast::irradiance
