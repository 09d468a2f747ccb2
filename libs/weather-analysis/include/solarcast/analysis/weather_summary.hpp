/**
 * @file weather_summary.hpp
 * @brief Plain-text rendering of a weather analysis.
 * @author Watosn
 */
#pragma once

#include <string>

#include "solarcast/analysis/weather_analyzer.hpp"

namespace solarcast::analysis {

/**
 * @brief Direction of a trend relative to a dead band.
 */
enum class TrendDirection : unsigned char { Falling, Steady, Rising };

[[nodiscard]] TrendDirection trend_direction(double slope, double dead_band);

/**
 * @brief Multi-line summary: current conditions, quality, temperature/cloud trends and
 * active alerts.
 */
[[nodiscard]] std::string format_weather_summary(const WeatherAnalysis& analysis);

}  // namespace solarcast::analysis
