/**
 * @file forecast_quality.cpp
 * @brief Forecast quality scoring implementation.
 * @author Watosn
 */

#include "solarcast/analysis/forecast_quality.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include "solarcast/analysis/weather_trends.hpp"

namespace solarcast::analysis {
namespace {

constexpr double kMinStability = 0.3;
constexpr double kTemperatureSpreadC = 20.0;
constexpr double kCloudSpreadPct = 40.0;
constexpr double kPrecipitationPenalty = 0.85;
constexpr double kMinQuality = 0.1;
constexpr double kMaxQuality = 0.99;

}  // namespace

double forecast_quality(const solarcast::core::WeatherSeries& series, const solarcast::core::AnalysisConfig& config) {
  if (series.empty()) {
    return std::clamp(config.degenerate_quality, kMinQuality, kMaxQuality);
  }
  const std::size_t n = std::min(series.size(), static_cast<std::size_t>(std::max(config.window_samples, 1)));

  std::vector<double> temps;
  std::vector<double> clouds;
  temps.reserve(n);
  clouds.reserve(n);
  bool has_precip = false;
  for (std::size_t i = 0; i < n; ++i) {
    temps.push_back(series[i].temperature_c);
    clouds.push_back(series[i].cloud_cover_pct);
    has_precip = has_precip || series[i].precipitation_mm.value_or(0.0) > 0.0;
  }

  const double temp_stability = std::max(kMinStability, 1.0 - std::sqrt(population_variance(temps)) / kTemperatureSpreadC);
  const double cloud_stability = std::max(kMinStability, 1.0 - std::sqrt(population_variance(clouds)) / kCloudSpreadPct);
  const double precip_factor = has_precip ? kPrecipitationPenalty : 1.0;

  const double quality = 0.4 * temp_stability + 0.4 * cloud_stability + 0.2 * precip_factor;
  if (!std::isfinite(quality)) {
    return kMinQuality;
  }
  return std::clamp(quality, kMinQuality, kMaxQuality);
}

}  // namespace solarcast::analysis
