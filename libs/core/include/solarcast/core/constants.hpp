/**
 * @file constants.hpp
 * @brief Shared numerical constants.
 * @author Watosn
 */
#pragma once

#include <numbers>

namespace solarcast::core::constants {

inline constexpr double kPi = std::numbers::pi;
inline constexpr double kTwoPi = 2.0 * std::numbers::pi;
inline constexpr double kDegToRad = std::numbers::pi / 180.0;
inline constexpr double kRadToDeg = 180.0 / std::numbers::pi;
inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kSecondsPerHour = 3600.0;
inline constexpr double kMinutesPerDegreeLongitude = 4.0;
inline constexpr double kDegreesPerHourAngle = 15.0;
inline constexpr double kDaysPerYear = 365.0;

}  // namespace solarcast::core::constants
