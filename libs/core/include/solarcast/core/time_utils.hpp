/**
 * @file time_utils.hpp
 * @brief ISO-8601 parsing and UTC calendar helpers.
 * @author Watosn
 */
#pragma once

#include <charconv>
#include <cmath>
#include <ctime>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "solarcast/core/constants.hpp"
#include "solarcast/core/types.hpp"

namespace solarcast::core {

/**
 * @brief Broken-down UTC calendar fields used by the solar geometry.
 */
struct UtcCalendar {
  int year{};
  int day_of_year{};
  int hour{};
  int minute{};
  int second{};
};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
inline int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

inline bool is_leap_year(const int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline unsigned days_in_month(const int y, const unsigned m) {
  static constexpr unsigned kDays[12] = {31U, 28U, 31U, 30U, 31U, 30U, 31U, 31U, 30U, 31U, 30U, 31U};
  if (m == 2U && is_leap_year(y)) {
    return 29U;
  }
  return kDays[m - 1U];
}

namespace detail {

inline bool parse_fixed_int(std::string_view text, std::size_t pos, std::size_t width, int& value) {
  if (pos + width > text.size()) {
    return false;
  }
  const char* first = text.data() + pos;
  const char* last = first + width;
  const auto res = std::from_chars(first, last, value);
  return res.ec == std::errc{} && res.ptr == last;
}

}  // namespace detail

/**
 * @brief Parse an ISO-8601 timestamp into a UTC epoch.
 *
 * Accepted: `YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]`. A space may replace `T`.
 * Timestamps without a zone designator are taken as UTC.
 * @return false when the text is malformed; `out` is left untouched.
 */
inline bool parse_iso8601_utc(std::string_view text, Epoch* out) {
  if (out == nullptr || text.size() < 16 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
      text[13] != ':') {
    return false;
  }
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  if (!detail::parse_fixed_int(text, 0, 4, year) || !detail::parse_fixed_int(text, 5, 2, month) ||
      !detail::parse_fixed_int(text, 8, 2, day) || !detail::parse_fixed_int(text, 11, 2, hour) ||
      !detail::parse_fixed_int(text, 14, 2, minute)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > static_cast<int>(days_in_month(year, static_cast<unsigned>(month))) ||
      hour > 23 || minute > 59 || hour < 0 || minute < 0) {
    return false;
  }

  std::size_t pos = 16;
  double seconds = 0.0;
  if (pos < text.size() && text[pos] == ':') {
    int whole = 0;
    if (!detail::parse_fixed_int(text, pos + 1, 2, whole) || whole < 0 || whole > 60) {
      return false;
    }
    seconds = static_cast<double>(whole);
    pos += 3;
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      double scale = 0.1;
      const std::size_t frac_start = pos;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        seconds += scale * static_cast<double>(text[pos] - '0');
        scale *= 0.1;
        ++pos;
      }
      if (pos == frac_start) {
        return false;
      }
    }
  }

  double offset_s = 0.0;
  if (pos < text.size()) {
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
      pos += 1;
    } else if ((text[pos] == '+' || text[pos] == '-') && pos + 6 == text.size() && text[pos + 3] == ':') {
      int oh = 0;
      int om = 0;
      if (!detail::parse_fixed_int(text, pos + 1, 2, oh) || !detail::parse_fixed_int(text, pos + 4, 2, om) || oh < 0 ||
          oh > 23 || om < 0 || om > 59) {
        return false;
      }
      const double sign = (text[pos] == '-') ? -1.0 : 1.0;
      offset_s = sign * (static_cast<double>(oh) * 3600.0 + static_cast<double>(om) * 60.0);
      pos += 6;
    } else {
      return false;
    }
  }

  const double day_s = static_cast<double>(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day))) *
                       constants::kSecondsPerDay;
  out->utc_seconds = day_s + static_cast<double>(hour) * 3600.0 + static_cast<double>(minute) * 60.0 + seconds - offset_s;
  return true;
}

/**
 * @brief Break a UTC epoch into calendar fields.
 */
inline UtcCalendar utc_calendar(double utc_seconds) {
  const std::time_t tt = static_cast<std::time_t>(std::floor(utc_seconds));
  std::tm tm_utc{};
#if defined(_WIN32)
  gmtime_s(&tm_utc, &tt);
#else
  gmtime_r(&tt, &tm_utc);
#endif
  return UtcCalendar{.year = tm_utc.tm_year + 1900,
                     .day_of_year = tm_utc.tm_yday + 1,
                     .hour = tm_utc.tm_hour,
                     .minute = tm_utc.tm_min,
                     .second = tm_utc.tm_sec};
}

/**
 * @brief Format a UTC epoch as `YYYY-MM-DDTHH:MM:SSZ`.
 */
inline std::string format_iso8601_utc(const Epoch& epoch) {
  const std::time_t tt = static_cast<std::time_t>(std::floor(epoch.utc_seconds));
  std::tm tm_utc{};
#if defined(_WIN32)
  gmtime_s(&tm_utc, &tt);
#else
  gmtime_r(&tt, &tm_utc);
#endif
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z", tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                     tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec);
}

}  // namespace solarcast::core
