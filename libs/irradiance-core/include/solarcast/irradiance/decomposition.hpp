/**
 * @file decomposition.hpp
 * @brief Erbs-style split of GHI into direct and diffuse components.
 * @author Watosn
 */
#pragma once

namespace solarcast::irradiance {

/**
 * @brief Beam/diffuse components of global horizontal irradiance.
 */
struct IrradianceComponents {
  double dni_w_m2{};
  double dhi_w_m2{};
  double clearness_index{};
};

/**
 * @brief Split GHI into DNI and DHI.
 *
 * The clearness index is taken against the clear-sky GHI for the same elevation and the diffuse
 * fraction follows three clearness bands (<=0.3, <=0.78, >0.78). Both components are >= 0 and
 * both are 0 for elevation <= 0.
 * @param ghi_w_m2 Global horizontal irradiance after cloud/aerosol attenuation.
 * @param elevation_deg Solar elevation.
 * @param cloud_cover_pct Cloud cover; carried for callers, the correlation does not use it.
 */
[[nodiscard]] IrradianceComponents decompose_irradiance(double ghi_w_m2, double elevation_deg, double cloud_cover_pct);

}  // namespace solarcast::irradiance
