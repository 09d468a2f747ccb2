/**
 * @file weather_trends.cpp
 * @brief Weather trend estimation implementation.
 * @author Watosn
 */

#include "solarcast/analysis/weather_trends.hpp"

#include <algorithm>
#include <cstddef>

#include <Eigen/Dense>

namespace solarcast::analysis {

std::optional<double> channel_value(const solarcast::core::WeatherSample& sample, const WeatherChannel channel) {
  switch (channel) {
    case WeatherChannel::Temperature:
      return sample.temperature_c;
    case WeatherChannel::CloudCover:
      return sample.cloud_cover_pct;
    case WeatherChannel::WindSpeed:
      return sample.wind_speed_mps;
    case WeatherChannel::Pressure:
      return sample.pressure_hpa;
    case WeatherChannel::Humidity:
      return sample.humidity_pct;
    case WeatherChannel::Precipitation:
      return sample.precipitation_mm;
  }
  return std::nullopt;
}

double least_squares_slope(const std::vector<double>& x, const std::vector<double>& y) {
  if (x.size() < 2U || x.size() != y.size()) {
    return 0.0;
  }
  const auto n = static_cast<Eigen::Index>(x.size());
  const Eigen::Map<const Eigen::VectorXd> xv(x.data(), n);
  const Eigen::Map<const Eigen::VectorXd> yv(y.data(), n);
  const Eigen::VectorXd dx = (xv.array() - xv.mean()).matrix();
  const Eigen::VectorXd dy = (yv.array() - yv.mean()).matrix();
  const double den = dx.squaredNorm();
  if (!(den > 0.0)) {
    return 0.0;
  }
  return dx.dot(dy) / den;
}

double population_variance(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  const Eigen::Map<const Eigen::VectorXd> v(values.data(), static_cast<Eigen::Index>(values.size()));
  return (v.array() - v.mean()).square().mean();
}

double channel_trend(const solarcast::core::WeatherSeries& series, const WeatherChannel channel, const int window_samples) {
  const std::size_t n = std::min(series.size(), static_cast<std::size_t>(std::max(window_samples, 0)));
  if (n < 2U) {
    return 0.0;
  }
  std::vector<double> x;
  std::vector<double> y;
  x.reserve(n);
  y.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const auto v = channel_value(series[i], channel);
    if (v.has_value()) {
      x.push_back(static_cast<double>(i));
      y.push_back(*v);
    }
  }
  return least_squares_slope(x, y);
}

WeatherTrends analyze_trends(const solarcast::core::WeatherSeries& series, const int window_samples) {
  return WeatherTrends{
      .temperature_per_h = channel_trend(series, WeatherChannel::Temperature, window_samples),
      .cloud_cover_per_h = channel_trend(series, WeatherChannel::CloudCover, window_samples),
      .wind_speed_per_h = channel_trend(series, WeatherChannel::WindSpeed, window_samples),
      .pressure_per_h = channel_trend(series, WeatherChannel::Pressure, window_samples),
      .humidity_per_h = channel_trend(series, WeatherChannel::Humidity, window_samples),
  };
}

}  // namespace solarcast::analysis
