/**
 * @file test_atmosphere_factors.cpp
 * @brief Cloud impact and aerosol transmission tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "solarcast/irradiance/atmosphere_factors.hpp"

namespace {

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace solarcast::irradiance;

  if (cloud_impact_factor(0.0, 25.0) != 0.95 || cloud_impact_factor(9.99, -30.0) != 0.95) {
    spdlog::error("near-clear floor mismatch");
    return 1;
  }
  if (cloud_impact_factor(95.0, 25.0) != 0.15 || cloud_impact_factor(100.0, 50.0) != 0.15) {
    spdlog::error("overcast floor mismatch");
    return 2;
  }
  // 0.5^1.3 opacity, temperature factor clamped to 0.8 at 25 C and 1.0 at 40 C.
  if (!approx_abs(cloud_impact_factor(50.0, 25.0), 0.72383, 1e-4) ||
      !approx_abs(cloud_impact_factor(50.0, 40.0), 0.65479, 1e-4)) {
    spdlog::error("mid-cloud factor mismatch: {} {}", cloud_impact_factor(50.0, 25.0), cloud_impact_factor(50.0, 40.0));
    return 3;
  }

  for (const double temp : {-40.0, -10.0, 0.0, 25.0, 40.0, 55.0}) {
    double prev = cloud_impact_factor(0.0, temp);
    for (double cloud = 0.0; cloud <= 100.0; cloud += 0.25) {
      const double f = cloud_impact_factor(cloud, temp);
      if (!(f > 0.0) || f > 1.0) {
        spdlog::error("cloud factor out of (0, 1] at cloud={} temp={}", cloud, temp);
        return 4;
      }
      if (f > prev) {
        spdlog::error("cloud factor increased at cloud={} temp={}: {} > {}", cloud, temp, f, prev);
        return 5;
      }
      prev = f;
    }
  }

  // Without the cap: 1 - 0.1^1.3 * 0.8 * 0.85.
  if (!approx_abs(cloud_impact_factor(10.0, 25.0, false), 0.965919, 1e-5) ||
      cloud_impact_factor(10.0, 25.0, true) != 0.95 || cloud_impact_factor(9.0, 25.0, false) != 0.95 ||
      cloud_impact_factor(50.0, 25.0, false) != cloud_impact_factor(50.0, 25.0)) {
    spdlog::error("uncapped cloud factor mismatch: {}", cloud_impact_factor(10.0, 25.0, false));
    return 8;
  }

  if (aerosol_transmission_factor(5.0) != 0.85 || aerosol_transmission_factor(15.0) != 0.90 ||
      aerosol_transmission_factor(25.0) != 0.93 || aerosol_transmission_factor(50.0) != 0.95) {
    spdlog::error("aerosol step values mismatch");
    return 6;
  }
  if (aerosol_transmission_factor(-0.1) != 0.0 || aerosol_transmission_factor(0.0) != 0.85 ||
      aerosol_transmission_factor(10.0) != 0.90 || aerosol_transmission_factor(20.0) != 0.93 ||
      aerosol_transmission_factor(30.0) != 0.95) {
    spdlog::error("aerosol breakpoints mismatch");
    return 7;
  }
  return 0;
}
