/**
 * @file atmosphere_factors.hpp
 * @brief Empirical cloud and aerosol attenuation factors.
 * @author Watosn
 */
#pragma once

namespace solarcast::irradiance {

/**
 * @brief Cloud attenuation factor in (0, 1].
 *
 * Piecewise: <10 % cover gives the near-clear floor 0.95, >90 % the overcast floor 0.15.
 * Between those a power-law opacity is scaled by a temperature proxy for cloud altitude and
 * floored at 0.1.
 * @param cloud_cover_pct Total cloud cover in percent.
 * @param temperature_c Air temperature in deg C.
 * @param cap_at_clear Also cap the band at 0.95 so the factor is non-increasing in cloud cover.
 * Without it, cover just above 10 % yields up to about 0.966.
 */
[[nodiscard]] double cloud_impact_factor(double cloud_cover_pct, double temperature_c, bool cap_at_clear = true);

/**
 * @brief Atmospheric transmission step function of solar elevation.
 *
 * Breakpoints: <0 -> 0, <10 -> 0.85, <20 -> 0.90, <30 -> 0.93, otherwise 0.95.
 */
[[nodiscard]] double aerosol_transmission_factor(double elevation_deg);

}  // namespace solarcast::irradiance
