/**
 * @file weather_analysis_cli.cpp
 * @brief Weather trend/alert/quality analysis CLI.
 * @author Watosn
 */

#include <filesystem>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "solarcast/analysis/weather_analyzer.hpp"
#include "solarcast/analysis/weather_summary.hpp"
#include "solarcast/core/config.hpp"
#include "solarcast/weather/hourly_csv_reader.hpp"

int main(int argc, char** argv) {
  if (argc != 2) {
    spdlog::error("usage: weather_analysis_cli <input_csv>");
    return 1;
  }
  const std::filesystem::path input_csv = argv[1];

  solarcast::core::Status cfg_status = solarcast::core::Status::Ok;
  const auto cfg = solarcast::core::engine_config_from_environment(&cfg_status);
  if (cfg_status != solarcast::core::Status::Ok) {
    spdlog::warn("ignoring SOLARCAST_CONFIG_FILE: {}", solarcast::core::status_name(cfg_status));
  }

  const auto reader = solarcast::weather::HourlyCsvSeriesReader::Create({.csv_file = input_csv, .defaults = cfg.defaults});
  if (reader->status() == solarcast::core::Status::InvalidInput) {
    spdlog::error("failed to read weather csv: {}", reader->message());
    return 2;
  }
  if (reader->series().empty()) {
    spdlog::warn("no samples in {}; reporting fallback analysis", input_csv.string());
  }

  const solarcast::analysis::WeatherAnalyzer analyzer(cfg.analysis);
  const auto a = analyzer.analyze(reader->series());

  fmt::print("trend temp_c_per_h={:.3f} cloud_pct_per_h={:.2f} wind_mps_per_h={:.3f} pressure_hpa_per_h={:.2f} humidity_pct_per_h={:.2f}\n",
             a.trends.temperature_per_h, a.trends.cloud_cover_per_h, a.trends.wind_speed_per_h, a.trends.pressure_per_h,
             a.trends.humidity_per_h);
  fmt::print("precipitation_mm_per_h={:.3f}\n",
             solarcast::analysis::channel_trend(reader->series(), solarcast::analysis::WeatherChannel::Precipitation,
                                                cfg.analysis.window_samples));
  fmt::print("alerts cloud={} temperature={} wind={} pressure={} precipitation={}\n", a.alerts.cloud_cover ? 1 : 0,
             a.alerts.temperature ? 1 : 0, a.alerts.wind ? 1 : 0, a.alerts.pressure ? 1 : 0, a.alerts.precipitation ? 1 : 0);
  fmt::print("forecast_quality={:.3f} freshness={}\n", a.forecast_quality, a.data_freshness);
  fmt::print("{}", solarcast::analysis::format_weather_summary(a));
  return 0;
}
