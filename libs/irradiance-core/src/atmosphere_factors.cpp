/**
 * @file atmosphere_factors.cpp
 * @brief Cloud and aerosol attenuation implementation.
 * @author Watosn
 */

#include "solarcast/irradiance/atmosphere_factors.hpp"

#include <algorithm>
#include <cmath>

namespace solarcast::irradiance {
namespace {

constexpr double kClearCloudLimitPct = 10.0;
constexpr double kOvercastCloudLimitPct = 90.0;
constexpr double kClearFactor = 0.95;
constexpr double kOvercastFactor = 0.15;
constexpr double kOpacityExponent = 1.3;
constexpr double kOpacityWeight = 0.85;
constexpr double kMinimumFactor = 0.1;

}  // namespace

double cloud_impact_factor(const double cloud_cover_pct, const double temperature_c, const bool cap_at_clear) {
  if (cloud_cover_pct < kClearCloudLimitPct) {
    return kClearFactor;
  }
  if (cloud_cover_pct > kOvercastCloudLimitPct) {
    return kOvercastFactor;
  }
  const double opacity = std::pow(cloud_cover_pct / 100.0, kOpacityExponent);
  // Colder air reads as higher, thinner cloud.
  const double temp_factor = std::clamp((temperature_c + 5.0) / 45.0, 0.8, 1.0);
  const double reduction = 1.0 - opacity * temp_factor * kOpacityWeight;
  if (!std::isfinite(reduction)) {
    return kMinimumFactor;
  }
  // Just above 10 % the power law would exceed the near-clear value.
  if (!cap_at_clear) {
    return std::max(reduction, kMinimumFactor);
  }
  return std::clamp(reduction, kMinimumFactor, kClearFactor);
}

double aerosol_transmission_factor(const double elevation_deg) {
  if (elevation_deg < 0.0) {
    return 0.0;
  }
  if (elevation_deg < 10.0) {
    return 0.85;
  }
  if (elevation_deg < 20.0) {
    return 0.90;
  }
  if (elevation_deg < 30.0) {
    return 0.93;
  }
  return 0.95;
}

}  // namespace solarcast::irradiance
