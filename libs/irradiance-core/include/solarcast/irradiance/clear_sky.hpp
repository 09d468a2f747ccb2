/**
 * @file clear_sky.hpp
 * @brief Cloud-free global horizontal irradiance model.
 * @author Watosn
 */
#pragma once

namespace solarcast::irradiance {

/**
 * @brief Empirical clear-sky coefficients.
 */
struct ClearSkyCoefficients {
  double c0_w_m2{910.6};
  double c1{0.6797};
  double c2{-0.00639};
};

/**
 * @brief Kasten-Young relative airmass.
 *
 * Only meaningful for zenith below ~96 deg; returns 0 where the expression is not finite.
 */
[[nodiscard]] double kasten_young_airmass(double zenith_deg);

/**
 * @brief Clear-sky GHI in W/m^2, 0 when the sun is at or below the horizon.
 */
[[nodiscard]] double clear_sky_ghi_w_m2(double elevation_deg, double zenith_deg,
                                        const ClearSkyCoefficients& coeffs = ClearSkyCoefficients{});

}  // namespace solarcast::irradiance
