/**
 * @file forecast_summary.cpp
 * @brief Forecast summary statistics implementation.
 * @author Watosn
 */

#include "solarcast/forecast/forecast_summary.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace solarcast::forecast {
namespace {

constexpr double kReferenceShortwaveWm2 = 800.0;

}  // namespace

ForecastSummary summarize_forecast(const std::vector<ForecastPoint>& points) {
  if (points.empty()) {
    return ForecastSummary{.status = solarcast::core::Status::DataUnavailable};
  }

  ForecastSummary out{.points = points.size()};
  double sum_irr = 0.0;
  double sum_conf = 0.0;
  double lo = std::numeric_limits<double>::infinity();
  double hi = 0.0;
  for (const auto& p : points) {
    sum_irr += p.predicted_irradiance_w_m2;
    sum_conf += p.confidence;
    lo = std::min(lo, p.predicted_irradiance_w_m2);
    hi = std::max(hi, p.predicted_irradiance_w_m2);
    if (p.predicted_irradiance_w_m2 > 0.0) {
      ++out.daylight_hours;
    }
  }
  const double n = static_cast<double>(points.size());
  out.peak_irradiance_w_m2 = hi;
  out.min_irradiance_w_m2 = lo;
  out.mean_irradiance_w_m2 = sum_irr / n;
  out.mean_confidence = sum_conf / n;
  out.estimated_energy_kwh_m2 = sum_irr / 1000.0;
  return out;
}

int solar_potential_score(const solarcast::core::WeatherSeries& series) {
  double sum_positive = 0.0;
  std::size_t n_positive = 0;
  double sum_cloud = 0.0;
  for (const auto& s : series.samples) {
    if (s.shortwave_w_m2 > 0.0) {
      sum_positive += s.shortwave_w_m2;
      ++n_positive;
    }
    sum_cloud += s.cloud_cover_pct;
  }
  if (n_positive == 0) {
    return 0;
  }
  const double mean_radiation = sum_positive / static_cast<double>(n_positive);
  const double mean_cloud = sum_cloud / static_cast<double>(series.size());
  const double cloud_factor = (100.0 - mean_cloud) / 100.0;
  const double radiation_factor = std::min(1.0, mean_radiation / kReferenceShortwaveWm2);
  const double score = std::round(cloud_factor * radiation_factor * 100.0);
  return static_cast<int>(std::clamp(score, 0.0, 100.0));
}

}  // namespace solarcast::forecast
