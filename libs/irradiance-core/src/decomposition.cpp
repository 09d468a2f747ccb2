/**
 * @file decomposition.cpp
 * @brief GHI decomposition implementation.
 * @author Watosn
 */

#include "solarcast/irradiance/decomposition.hpp"

#include <algorithm>
#include <cmath>

#include "solarcast/core/constants.hpp"
#include "solarcast/irradiance/clear_sky.hpp"

namespace solarcast::irradiance {
namespace {

constexpr double kLowClearness = 0.3;
constexpr double kHighClearness = 0.78;
constexpr double kMinSinElevation = 0.01;

double diffuse_fraction(const double kt, const double sin_elevation) {
  if (kt <= kLowClearness) {
    return 1.020 - 0.254 * kt + 0.0123 * sin_elevation;
  }
  if (kt <= kHighClearness) {
    return 0.972 - 0.306 * kt + 0.0311 * sin_elevation;
  }
  return 0.29 * kt + 0.0049 * sin_elevation;
}

}  // namespace

IrradianceComponents decompose_irradiance(const double ghi_w_m2, const double elevation_deg,
                                          const double /*cloud_cover_pct*/) {
  if (!(elevation_deg > 0.0) || !std::isfinite(ghi_w_m2)) {
    return IrradianceComponents{};
  }

  const double sin_elevation = std::sin(elevation_deg * solarcast::core::constants::kDegToRad);
  const double clear_sky = clear_sky_ghi_w_m2(elevation_deg, 90.0 - elevation_deg);
  const double kt = clear_sky > 0.0 ? std::min(1.0, ghi_w_m2 / clear_sky) : 0.0;

  const double dhi = ghi_w_m2 * diffuse_fraction(kt, sin_elevation);
  const double dni = (ghi_w_m2 - dhi) / std::max(kMinSinElevation, sin_elevation);

  return IrradianceComponents{
      .dni_w_m2 = std::max(0.0, dni),
      .dhi_w_m2 = std::max(0.0, dhi),
      .clearness_index = kt,
  };
}

}  // namespace solarcast::irradiance
