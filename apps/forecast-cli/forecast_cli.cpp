/**
 * @file forecast_cli.cpp
 * @brief Single-hour irradiance forecast CLI.
 * @author Watosn
 */

#include <cstdlib>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "solarcast/core/config.hpp"
#include "solarcast/forecast/forecast_engine.hpp"
#include "solarcast/weather/series_builder.hpp"

int main(int argc, char** argv) {
  if (argc != 7) {
    spdlog::error("usage: forecast_cli <lat_deg> <lon_deg> <iso_time_utc> <temperature_c> <cloud_cover_pct> <shortwave_w_m2>");
    return 1;
  }

  solarcast::core::Status cfg_status = solarcast::core::Status::Ok;
  const auto cfg = solarcast::core::engine_config_from_environment(&cfg_status);
  if (cfg_status != solarcast::core::Status::Ok) {
    spdlog::warn("ignoring SOLARCAST_CONFIG_FILE: {}", solarcast::core::status_name(cfg_status));
  }

  const solarcast::core::GeoLocation location{.lat_deg = std::atof(argv[1]), .lon_deg = std::atof(argv[2])};

  solarcast::weather::HourlyChannels channels{};
  channels.time = {argv[3]};
  channels.temperature_2m = {std::atof(argv[4])};
  channels.cloud_cover = {std::atof(argv[5])};
  channels.shortwave_radiation = {std::atof(argv[6])};
  const auto built = solarcast::weather::build_weather_series(channels, cfg.defaults);
  if (built.status != solarcast::core::Status::Ok) {
    spdlog::error("bad input: {}", built.message);
    return 2;
  }

  const solarcast::forecast::ForecastEngine engine(cfg.forecast);
  const auto result = engine.forecast(location, built.series);
  if (result.status != solarcast::core::Status::Ok) {
    spdlog::error("forecast failed: {}", result.message);
    return 3;
  }

  const auto& p = result.points.front();
  const auto& b = p.breakdown;
  fmt::print("elevation_deg={:.4f} zenith_deg={:.4f} azimuth_deg={:.4f}\n", b.position.elevation_deg,
             b.position.zenith_deg, b.position.azimuth_deg);
  fmt::print("clear_sky_ghi={:.3f} cloud_impact={:.4f} aerosol={:.3f} predicted_ghi={:.3f} temp_loss={:.4f}\n",
             b.clear_sky_ghi_w_m2, b.cloud_impact, b.aerosol_factor, b.predicted_ghi_w_m2, b.temperature_loss_factor);
  fmt::print("dni={:.3f} dhi={:.3f} kt={:.4f}\n", b.components.dni_w_m2, b.components.dhi_w_m2,
             b.components.clearness_index);
  fmt::print("time={} predicted_irradiance_w_m2={:.3f} confidence={:.4f} night={}\n", p.time, p.predicted_irradiance_w_m2,
             p.confidence, b.night ? 1 : 0);
  return 0;
}
