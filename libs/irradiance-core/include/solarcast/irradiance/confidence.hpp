/**
 * @file confidence.hpp
 * @brief Per-hour forecast confidence estimate.
 * @author Watosn
 */
#pragma once

#include <cstddef>

#include "solarcast/core/types.hpp"

namespace solarcast::irradiance {

/**
 * @brief Confidence in [0.1, 1] for one forecast hour.
 *
 * Night (elevation < 0) returns `night_confidence` clamped to [0.1, 1]. Otherwise the product of a neighbour cloud
 * stability term, an elevation term `min(1, elevation/80)` and a temperature term (0.7 outside
 * [-10, 40] deg C, else 0.9), floored at 0.1.
 * @param index Position of the hour inside `series`; neighbours at index-1 and index+1 are read.
 */
[[nodiscard]] double forecast_confidence(double cloud_cover_pct, double elevation_deg, double temperature_c,
                                         std::size_t index, const solarcast::core::WeatherSeries& series,
                                         double night_confidence = 0.95);

}  // namespace solarcast::irradiance
