/**
 * @file clear_sky.cpp
 * @brief Clear-sky irradiance implementation.
 * @author Watosn
 */

#include "solarcast/irradiance/clear_sky.hpp"

#include <algorithm>
#include <cmath>

#include "solarcast/core/constants.hpp"

namespace solarcast::irradiance {

double kasten_young_airmass(const double zenith_deg) {
  const double zenith_rad = zenith_deg * solarcast::core::constants::kDegToRad;
  const double am = 1.0 / (std::cos(zenith_rad) + 0.50572 * std::pow(96.07995 - zenith_deg, -1.6364));
  return std::isfinite(am) ? am : 0.0;
}

double clear_sky_ghi_w_m2(const double elevation_deg, const double zenith_deg, const ClearSkyCoefficients& coeffs) {
  if (!(elevation_deg > 0.0)) {
    return 0.0;
  }
  const double zenith_rad = zenith_deg * solarcast::core::constants::kDegToRad;
  const double airmass = kasten_young_airmass(zenith_deg);
  const double ghi = coeffs.c0_w_m2 * std::exp(coeffs.c1 - coeffs.c2 * airmass) * std::max(0.0, std::cos(zenith_rad));
  if (!std::isfinite(ghi)) {
    return 0.0;
  }
  return std::max(0.0, ghi);
}

}  // namespace solarcast::irradiance
