/**
 * @file forecast_batch_cli.cpp
 * @brief Batch irradiance forecast CLI over an hourly weather CSV.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "solarcast/core/config.hpp"
#include "solarcast/forecast/forecast_engine.hpp"
#include "solarcast/forecast/forecast_summary.hpp"
#include "solarcast/forecast/weather_join.hpp"
#include "solarcast/weather/hourly_csv_reader.hpp"

int main(int argc, char** argv) {
  if (argc != 5) {
    spdlog::error("usage: forecast_batch_cli <input_csv> <output_csv> <lat_deg> <lon_deg>");
    spdlog::error("input header: time,temperature_2m,cloud_cover,shortwave_radiation[,optional channels]");
    return 1;
  }

  const std::filesystem::path input_csv = argv[1];
  const std::filesystem::path output_csv = argv[2];
  const solarcast::core::GeoLocation location{.lat_deg = std::atof(argv[3]), .lon_deg = std::atof(argv[4])};

  solarcast::core::Status cfg_status = solarcast::core::Status::Ok;
  const auto cfg = solarcast::core::engine_config_from_environment(&cfg_status);
  if (cfg_status != solarcast::core::Status::Ok) {
    spdlog::warn("ignoring SOLARCAST_CONFIG_FILE: {}", solarcast::core::status_name(cfg_status));
  }

  const auto reader = solarcast::weather::HourlyCsvSeriesReader::Create({.csv_file = input_csv, .defaults = cfg.defaults});
  if (reader->status() != solarcast::core::Status::Ok) {
    spdlog::error("failed to read weather csv: {} ({})", reader->message(), solarcast::core::status_name(reader->status()));
    return 2;
  }
  if (reader->skipped_rows() > 0U) {
    spdlog::warn("skipped {} malformed rows in {}", reader->skipped_rows(), input_csv.string());
  }

  const solarcast::forecast::ForecastEngine engine(cfg.forecast);
  const auto result = engine.forecast(location, reader->series());
  if (result.status != solarcast::core::Status::Ok) {
    spdlog::error("forecast failed: {}", result.message);
    return 3;
  }

  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 4;
  }

  out << "time,predicted_irradiance_w_m2,confidence,confidence_low_w_m2,confidence_high_w_m2,efficiency_pct,"
         "elevation_deg,azimuth_deg,clear_sky_ghi_w_m2,cloud_impact,aerosol_factor,temperature_loss_factor,dni_w_m2,dhi_w_m2\n";
  const auto joined = solarcast::forecast::join_forecast_with_weather(result.points, reader->series());
  for (const auto& j : joined) {
    const auto& p = j.point;
    const auto& b = p.breakdown;
    out << fmt::format("{},{:.3f},{:.4f},{:.3f},{:.3f},{},{:.4f},{:.4f},{:.3f},{:.4f},{:.3f},{:.4f},{:.3f},{:.3f}\n", p.time,
                       p.predicted_irradiance_w_m2, p.confidence, j.confidence_low_w_m2, j.confidence_high_w_m2,
                       j.efficiency_pct.has_value() ? fmt::format("{:.2f}", *j.efficiency_pct) : std::string{},
                       b.position.elevation_deg, b.position.azimuth_deg, b.clear_sky_ghi_w_m2, b.cloud_impact,
                       b.aerosol_factor, b.temperature_loss_factor, b.components.dni_w_m2, b.components.dhi_w_m2);
  }

  const auto summary = solarcast::forecast::summarize_forecast(result.points);
  spdlog::info("points={} daylight_hours={} peak={:.1f} mean={:.1f} W/m^2 energy={:.2f} kWh/m^2 mean_confidence={:.1f}%",
               summary.points, summary.daylight_hours, summary.peak_irradiance_w_m2, summary.mean_irradiance_w_m2,
               summary.estimated_energy_kwh_m2, summary.mean_confidence * 100.0);
  spdlog::info("solar potential score: {}", solarcast::forecast::solar_potential_score(reader->series()));
  spdlog::info("wrote forecast batch output: {}", output_csv.string());
  return 0;
}
