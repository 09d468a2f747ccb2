/**
 * @file solar_position.cpp
 * @brief Spencer solar position implementation.
 * @author Watosn
 */

#include "solarcast/solar/solar_position.hpp"

#include <algorithm>
#include <cmath>

#include "solarcast/core/constants.hpp"
#include "solarcast/core/time_utils.hpp"

namespace solarcast::solar {
namespace {

using solarcast::core::constants::kDegToRad;
using solarcast::core::constants::kRadToDeg;

// Below this the horizontal-plane azimuth is undefined (pole or zenith sun).
constexpr double kAzimuthDenominatorFloor = 1e-12;

}  // namespace

double fractional_year_rad(const int day_of_year) {
  return solarcast::core::constants::kTwoPi * static_cast<double>(day_of_year - 1) / solarcast::core::constants::kDaysPerYear;
}

double spencer_declination_rad(const double gamma_rad) {
  return 0.006918 - 0.399912 * std::cos(gamma_rad) + 0.070257 * std::sin(gamma_rad) -
         0.006758 * std::cos(2.0 * gamma_rad) + 0.000907 * std::sin(2.0 * gamma_rad) -
         0.00205 * std::cos(3.0 * gamma_rad) + 0.00029 * std::sin(3.0 * gamma_rad);
}

double equation_of_time_minutes(const double gamma_rad) {
  return 229.18 * (0.017645 * std::sin(2.0 * gamma_rad) - 0.033827 * std::cos(gamma_rad) -
                   0.00969 * std::sin(gamma_rad) - 0.00569 * std::cos(2.0 * gamma_rad));
}

SolarPosition compute_solar_position(const solarcast::core::GeoLocation& location, const solarcast::core::Epoch& epoch) {
  const auto cal = solarcast::core::utc_calendar(epoch.utc_seconds);
  const double gamma = fractional_year_rad(cal.day_of_year);
  const double declination = spencer_declination_rad(gamma);
  const double eot_min = equation_of_time_minutes(gamma);

  // Whole UTC minutes of day; longitude stands in for the time zone.
  const double utc_minutes = static_cast<double>(cal.hour * 60 + cal.minute);
  const double solar_minutes =
      utc_minutes + eot_min + location.lon_deg * solarcast::core::constants::kMinutesPerDegreeLongitude;
  const double solar_hours = solar_minutes / 60.0;
  const double hour_angle = (solar_hours - 12.0) * solarcast::core::constants::kDegreesPerHourAngle * kDegToRad;

  const double lat = location.lat_deg * kDegToRad;
  const double sin_elevation =
      std::sin(lat) * std::sin(declination) + std::cos(lat) * std::cos(declination) * std::cos(hour_angle);
  const double elevation = std::asin(std::clamp(sin_elevation, -1.0, 1.0));

  double azimuth = 0.0;
  if (elevation > 0.0) {
    const double denom = std::cos(elevation) * std::cos(lat);
    if (std::abs(denom) > kAzimuthDenominatorFloor) {
      const double cos_azimuth = (std::sin(declination) - std::sin(elevation) * std::sin(lat)) / denom;
      azimuth = std::acos(std::clamp(cos_azimuth, -1.0, 1.0));
      if (std::sin(hour_angle) > 0.0) {
        azimuth = solarcast::core::constants::kTwoPi - azimuth;
      }
    }
  }

  const double elevation_deg = elevation * kRadToDeg;
  return SolarPosition{
      .elevation_deg = elevation_deg,
      .zenith_deg = 90.0 - elevation_deg,
      .azimuth_deg = azimuth * kRadToDeg,
      .declination_rad = declination,
      .hour_angle_rad = hour_angle,
      .equation_of_time_min = eot_min,
  };
}

}  // namespace solarcast::solar
