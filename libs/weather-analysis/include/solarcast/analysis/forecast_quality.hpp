/**
 * @file forecast_quality.hpp
 * @brief Variance-based forecast quality score.
 * @author Watosn
 */
#pragma once

#include "solarcast/core/config.hpp"
#include "solarcast/core/types.hpp"

namespace solarcast::analysis {

/**
 * @brief Composite stability score in [0.1, 0.99].
 *
 * Over the first `min(window, size)` samples:
 * `0.4*max(0.3, 1 - sd(temp)/20) + 0.4*max(0.3, 1 - sd(cloud)/40) + 0.2*(any precip ? 0.85 : 1)`.
 * An empty series returns `config.degenerate_quality`, clamped to the same bounds.
 */
[[nodiscard]] double forecast_quality(const solarcast::core::WeatherSeries& series,
                                      const solarcast::core::AnalysisConfig& config = {});

}  // namespace solarcast::analysis
