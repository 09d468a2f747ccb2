/**
 * @file config.hpp
 * @brief Tunable model constants and `key = value` config-file loading.
 * @author Watosn
 */
#pragma once

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string>

#include "solarcast/core/types.hpp"

namespace solarcast::core {

/**
 * @brief Irradiance pipeline tunables.
 */
struct ForecastConfig {
  double system_efficiency{0.85};
  double temperature_coefficient_per_c{-0.004};  // -0.4 %/°C above reference
  double reference_temperature_c{25.0};
  double night_confidence{0.95};  // [0.1, 1]
  // Cap the 10-90 % cloud band at the clear-sky factor so impact never rises with cloud.
  bool monotonic_cloud_cap{true};
};

/**
 * @brief Defaults filled into required channels when the provider leaves them out.
 */
struct SeriesDefaults {
  double temperature_c{25.0};
  double cloud_cover_pct{0.0};
  double shortwave_w_m2{0.0};
};

/**
 * @brief Weather alert trigger levels.
 */
struct AlertThresholds {
  double cloud_cover_pct{80.0};
  double cloud_variability_pct{50.0};
  int cloud_variability_window{6};
  double temperature_low_c{-10.0};
  double temperature_high_c{40.0};
  double wind_speed_mps{20.0};
  double pressure_trend_hpa_per_h{1.5};
  double precipitation_mm{5.0};
};

/**
 * @brief Weather analysis tunables.
 */
struct AnalysisConfig {
  int window_samples{24};
  double degenerate_quality{0.5};  // [0.1, 0.99]
  AlertThresholds alerts{};
};

/**
 * @brief Aggregate configuration for forecasting and analysis.
 */
struct EngineConfig {
  ForecastConfig forecast{};
  SeriesDefaults defaults{};
  AnalysisConfig analysis{};
};

namespace config_detail {

inline std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.erase(s.begin());
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.pop_back();
  }
  return s;
}

inline bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  value = v;
  return true;
}

inline bool parse_int(const std::string& text, int& value) {
  const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
  return res.ec == std::errc{} && res.ptr == text.data() + text.size();
}

inline bool parse_bool(const std::string& text, bool& value) {
  if (text == "true" || text == "1") {
    value = true;
  } else if (text == "false" || text == "0") {
    value = false;
  } else {
    return false;
  }
  return true;
}

inline bool in_range(double v, double lo, double hi) { return v >= lo && v <= hi; }

inline bool assign(EngineConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "forecast.monotonic_cloud_cap") {
    return parse_bool(value, cfg.forecast.monotonic_cloud_cap);
  }
  if (key == "analysis.window_samples" || key == "alerts.cloud_variability_window") {
    int v = 0;
    if (!parse_int(value, v) || v < 1) {
      return false;
    }
    (key == "analysis.window_samples" ? cfg.analysis.window_samples : cfg.analysis.alerts.cloud_variability_window) = v;
    return true;
  }

  double v = 0.0;
  if (!parse_double(value, v) || !std::isfinite(v)) {
    return false;
  }
  if (key == "forecast.system_efficiency") {
    if (v < 0.0) {
      return false;
    }
    cfg.forecast.system_efficiency = v;
  } else if (key == "forecast.temperature_coefficient_per_c") {
    cfg.forecast.temperature_coefficient_per_c = v;
  } else if (key == "forecast.reference_temperature_c") {
    cfg.forecast.reference_temperature_c = v;
  } else if (key == "forecast.night_confidence") {
    if (!in_range(v, 0.1, 1.0)) {
      return false;
    }
    cfg.forecast.night_confidence = v;
  } else if (key == "defaults.temperature_c") {
    cfg.defaults.temperature_c = v;
  } else if (key == "defaults.cloud_cover_pct") {
    cfg.defaults.cloud_cover_pct = v;
  } else if (key == "defaults.shortwave_w_m2") {
    cfg.defaults.shortwave_w_m2 = v;
  } else if (key == "analysis.degenerate_quality") {
    if (!in_range(v, 0.1, 0.99)) {
      return false;
    }
    cfg.analysis.degenerate_quality = v;
  } else if (key == "alerts.cloud_cover_pct") {
    cfg.analysis.alerts.cloud_cover_pct = v;
  } else if (key == "alerts.cloud_variability_pct") {
    cfg.analysis.alerts.cloud_variability_pct = v;
  } else if (key == "alerts.temperature_low_c") {
    cfg.analysis.alerts.temperature_low_c = v;
  } else if (key == "alerts.temperature_high_c") {
    cfg.analysis.alerts.temperature_high_c = v;
  } else if (key == "alerts.wind_speed_mps") {
    cfg.analysis.alerts.wind_speed_mps = v;
  } else if (key == "alerts.pressure_trend_hpa_per_h") {
    cfg.analysis.alerts.pressure_trend_hpa_per_h = v;
  } else if (key == "alerts.precipitation_mm") {
    cfg.analysis.alerts.precipitation_mm = v;
  } else {
    return false;
  }
  return true;
}

}  // namespace config_detail

/**
 * @brief Load overrides from a `key = value` file on top of `*out`.
 *
 * Blank lines and `#` comments are ignored. Any unknown key, malformed value or value outside
 * its key's range fails the whole load and leaves `*out` unchanged.
 */
inline Status load_engine_config(const std::string& path, EngineConfig* out) {
  if (out == nullptr) {
    return Status::InvalidInput;
  }
  std::ifstream in(path);
  if (!in.is_open()) {
    return Status::DataUnavailable;
  }

  EngineConfig parsed = *out;
  std::string line{};
  while (std::getline(in, line)) {
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    line = config_detail::trim(line);
    if (line.empty()) {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      return Status::InvalidInput;
    }
    const std::string key = config_detail::trim(line.substr(0, eq));
    const std::string value = config_detail::trim(line.substr(eq + 1));
    if (!config_detail::assign(parsed, key, value)) {
      return Status::InvalidInput;
    }
  }

  *out = parsed;
  return Status::Ok;
}

/**
 * @brief Built-in defaults, overridden by `SOLARCAST_CONFIG_FILE` when set and loadable.
 */
inline EngineConfig engine_config_from_environment(Status* load_status = nullptr) {
  EngineConfig cfg{};
  Status st = Status::Ok;
  const char* env = std::getenv("SOLARCAST_CONFIG_FILE");
  if (env != nullptr && env[0] != '\0') {
    st = load_engine_config(std::string(env), &cfg);
  }
  if (load_status != nullptr) {
    *load_status = st;
  }
  return cfg;
}

}  // namespace solarcast::core
