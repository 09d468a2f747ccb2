/**
 * @file test_decomposition.cpp
 * @brief GHI beam/diffuse decomposition tests.
 * @author Watosn
 */

#include <cmath>
#include <numbers>

#include <spdlog/spdlog.h>

#include "solarcast/irradiance/decomposition.hpp"

namespace {

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace solarcast::irradiance;

  for (const double elev : {0.0, -5.0}) {
    const auto c = decompose_irradiance(500.0, elev, 20.0);
    if (c.dni_w_m2 != 0.0 || c.dhi_w_m2 != 0.0) {
      spdlog::error("components not zero at elevation {}", elev);
      return 1;
    }
  }

  const double sin45 = std::sin(std::numbers::pi / 4.0);

  // Low clearness band: mostly diffuse.
  const auto low = decompose_irradiance(300.0, 45.0, 80.0);
  if (!approx_abs(low.clearness_index, 0.234, 2e-3) || !approx_abs(low.dhi_w_m2, 290.8, 0.5)) {
    spdlog::error("low-clearness split mismatch: kt={} dhi={}", low.clearness_index, low.dhi_w_m2);
    return 2;
  }
  if (!approx_abs(low.dhi_w_m2 + low.dni_w_m2 * sin45, 300.0, 1e-9)) {
    spdlog::error("low-clearness closure failed");
    return 3;
  }

  // High clearness band: beam dominated.
  const auto high = decompose_irradiance(1200.0, 45.0, 0.0);
  if (!(high.clearness_index > 0.78) || !(high.dni_w_m2 > high.dhi_w_m2) ||
      !approx_abs(high.dhi_w_m2 + high.dni_w_m2 * sin45, 1200.0, 1e-9)) {
    spdlog::error("high-clearness split mismatch: kt={} dni={} dhi={}", high.clearness_index, high.dni_w_m2,
                  high.dhi_w_m2);
    return 4;
  }

  for (double elev = 0.5; elev <= 90.0; elev += 2.5) {
    for (double ghi = 0.0; ghi <= 1400.0; ghi += 50.0) {
      const auto c = decompose_irradiance(ghi, elev, 50.0);
      if (!std::isfinite(c.dni_w_m2) || !std::isfinite(c.dhi_w_m2) || c.dni_w_m2 < 0.0 || c.dhi_w_m2 < 0.0 ||
          c.clearness_index < 0.0 || c.clearness_index > 1.0) {
        spdlog::error("invalid components at elev={} ghi={}", elev, ghi);
        return 5;
      }
    }
  }
  return 0;
}
