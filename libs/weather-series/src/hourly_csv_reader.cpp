/**
 * @file hourly_csv_reader.cpp
 * @brief Hourly CSV weather series implementation.
 * @author Watosn
 */

#include "solarcast/weather/hourly_csv_reader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace solarcast::weather {
namespace {

using Channel = std::vector<std::optional<double>>;

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(16);
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(token);
  }
  // getline drops a trailing empty field.
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

std::string strip(std::string s) {
  while (!s.empty() && (s.back() == '\r' || s.back() == ' ' || s.back() == '"')) {
    s.pop_back();
  }
  std::size_t first = 0;
  while (first < s.size() && (s[first] == ' ' || s[first] == '"')) {
    ++first;
  }
  return s.substr(first);
}

bool parse_cell(const std::string& text, std::optional<double>& value) {
  if (text.empty()) {
    value.reset();
    return true;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  value = v;
  return true;
}

Channel* channel_for(HourlyChannels& ch, const std::string& name) {
  if (name == "temperature_2m") return &ch.temperature_2m;
  if (name == "cloud_cover") return &ch.cloud_cover;
  if (name == "shortwave_radiation") return &ch.shortwave_radiation;
  if (name == "relative_humidity_2m") return &ch.relative_humidity_2m;
  if (name == "wind_speed_10m") return &ch.wind_speed_10m;
  if (name == "wind_direction_10m") return &ch.wind_direction_10m;
  if (name == "surface_pressure") return &ch.surface_pressure;
  if (name == "precipitation") return &ch.precipitation;
  if (name == "uv_index") return &ch.uv_index;
  if (name == "visibility") return &ch.visibility;
  return nullptr;
}

}  // namespace

bool parse_hourly_csv(std::istream& in, HourlyChannels* channels, std::size_t* skipped_rows, std::string* error) {
  auto fail = [error](std::string text) {
    if (error != nullptr) {
      *error = std::move(text);
    }
    return false;
  };
  if (channels == nullptr) {
    return fail("no output channels");
  }
  HourlyChannels parsed{};
  std::size_t skipped = 0;

  std::string line;
  std::vector<std::string> header;
  while (header.empty() && std::getline(in, line)) {
    if (!strip(line).empty()) {
      header = split_csv_line(line);
    }
  }
  std::size_t time_col = header.size();
  std::vector<Channel*> columns(header.size(), nullptr);
  for (std::size_t c = 0; c < header.size(); ++c) {
    const std::string name = strip(header[c]);
    if (name == "time") {
      if (time_col != header.size()) {
        return fail("header repeats column 'time'");
      }
      time_col = c;
      continue;
    }
    Channel* ch = channel_for(parsed, name);
    // A repeated channel would append twice per row and drift out of step with `time`.
    if (ch != nullptr && std::find(columns.begin(), columns.end(), ch) != columns.end()) {
      return fail(fmt::format("header repeats column '{}'", name));
    }
    columns[c] = ch;
  }
  if (time_col == header.size()) {
    return fail("header has no 'time' column");
  }

  std::vector<std::optional<double>> row_values(header.size());
  while (std::getline(in, line)) {
    if (strip(line).empty()) {
      continue;
    }
    const auto fields = split_csv_line(line);
    if (fields.size() != header.size()) {
      ++skipped;
      continue;
    }
    bool ok = true;
    for (std::size_t c = 0; c < fields.size() && ok; ++c) {
      if (columns[c] != nullptr) {
        ok = parse_cell(strip(fields[c]), row_values[c]);
      }
    }
    const std::string time = strip(fields[time_col]);
    if (!ok || time.empty()) {
      ++skipped;
      continue;
    }
    parsed.time.push_back(time);
    for (std::size_t c = 0; c < fields.size(); ++c) {
      if (columns[c] != nullptr) {
        columns[c]->push_back(row_values[c]);
      }
    }
  }

  *channels = std::move(parsed);
  if (skipped_rows != nullptr) {
    *skipped_rows += skipped;
  }
  return true;
}

std::unique_ptr<HourlyCsvSeriesReader> HourlyCsvSeriesReader::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    return std::unique_ptr<HourlyCsvSeriesReader>(new HourlyCsvSeriesReader(
        solarcast::core::WeatherSeries{}, solarcast::core::Status::DataUnavailable,
        fmt::format("cannot open {}", config.csv_file.string()), 0U));
  }

  HourlyChannels channels{};
  std::size_t skipped = 0;
  std::string error;
  if (!parse_hourly_csv(in, &channels, &skipped, &error)) {
    return std::unique_ptr<HourlyCsvSeriesReader>(new HourlyCsvSeriesReader(
        solarcast::core::WeatherSeries{}, solarcast::core::Status::InvalidInput,
        fmt::format("{}: {}", config.csv_file.string(), error), skipped));
  }

  auto built = build_weather_series(channels, config.defaults);
  return std::unique_ptr<HourlyCsvSeriesReader>(
      new HourlyCsvSeriesReader(std::move(built.series), built.status, std::move(built.message), skipped));
}

}  // namespace solarcast::weather
