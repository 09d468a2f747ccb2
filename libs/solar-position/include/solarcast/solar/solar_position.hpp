/**
 * @file solar_position.hpp
 * @brief Solar position from Spencer's fractional-year series.
 * @author Watosn
 */
#pragma once

#include "solarcast/core/types.hpp"

namespace solarcast::solar {

/**
 * @brief Topocentric sun angles in degrees.
 *
 * Elevation below zero means the sun is under the horizon; azimuth is 0 in that case.
 */
struct SolarPosition {
  double elevation_deg{};
  double zenith_deg{90.0};
  double azimuth_deg{};
  double declination_rad{};
  double hour_angle_rad{};
  double equation_of_time_min{};
};

/**
 * @brief Solar declination (rad) from Spencer's 7-term Fourier series.
 * @param gamma_rad Fractional year angle `2*pi*(doy-1)/365`.
 */
[[nodiscard]] double spencer_declination_rad(double gamma_rad);

/**
 * @brief Equation of time (minutes) from the 4-term Fourier series.
 */
[[nodiscard]] double equation_of_time_minutes(double gamma_rad);

/**
 * @brief Fractional year angle for a 1-based day of year.
 */
[[nodiscard]] double fractional_year_rad(int day_of_year);

/**
 * @brief Evaluate solar position for a location and UTC instant.
 *
 * Longitude is used directly as a time offset (4 min per degree); no timezone or DST lookup.
 * Always returns finite angles for finite inputs.
 */
[[nodiscard]] SolarPosition compute_solar_position(const solarcast::core::GeoLocation& location,
                                                   const solarcast::core::Epoch& epoch);

}  // namespace solarcast::solar
