/**
 * @file hourly_csv_reader.hpp
 * @brief Weather series backed by an hourly provider CSV export.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <utility>

#include "solarcast/core/config.hpp"
#include "solarcast/core/types.hpp"
#include "solarcast/weather/series_builder.hpp"

namespace solarcast::weather {

/**
 * @brief Reads header-named hourly CSV columns into a default-filled series.
 *
 * Recognised columns: `time` (required), `temperature_2m`, `cloud_cover`,
 * `shortwave_radiation`, `relative_humidity_2m`, `wind_speed_10m`, `wind_direction_10m`,
 * `surface_pressure`, `precipitation`, `uv_index`, `visibility`. Unknown columns are ignored,
 * empty cells are absent values.
 */
class HourlyCsvSeriesReader final {
 public:
  /**
   * @brief CSV reader configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
    solarcast::core::SeriesDefaults defaults{};
  };

  /**
   * @brief Factory helper that parses and validates CSV input.
   */
  static std::unique_ptr<HourlyCsvSeriesReader> Create(const Config& config);

  [[nodiscard]] const solarcast::core::WeatherSeries& series() const { return series_; }
  [[nodiscard]] solarcast::core::Status status() const { return status_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  /**
   * @brief Rows dropped for a wrong field count or a non-numeric cell.
   */
  [[nodiscard]] std::size_t skipped_rows() const { return skipped_rows_; }

 private:
  HourlyCsvSeriesReader(solarcast::core::WeatherSeries series, solarcast::core::Status status, std::string message,
                        std::size_t skipped_rows)
      : series_(std::move(series)), status_(status), message_(std::move(message)), skipped_rows_(skipped_rows) {}

  solarcast::core::WeatherSeries series_{};
  solarcast::core::Status status_{solarcast::core::Status::Ok};
  std::string message_{};
  std::size_t skipped_rows_{};
};

/**
 * @brief Parse CSV text already held in memory into hourly channels.
 * @param skipped_rows Incremented once per malformed data row.
 * @param error Receives the reason when the header is rejected.
 * @return false when the header lacks a `time` column or names a column twice;
 * `*channels` is left untouched.
 */
[[nodiscard]] bool parse_hourly_csv(std::istream& in, HourlyChannels* channels, std::size_t* skipped_rows,
                                    std::string* error = nullptr);

}  // namespace solarcast::weather
