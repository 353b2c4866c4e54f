#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// Date: calendar day without time of day
// -----------------------------------------------------------------------------
//
// @brief  A single civil day, stored as the number of days since 1970-01-01
//         in the proleptic Gregorian calendar.
//
// @details
// Every date in the engine (trade date, lot acquisition date, report range
// bounds) is a whole day. Storing a day count instead of a time_point means
// holding periods are plain integer differences: no time zones, no DST, no
// partial days that could push a 365-day holding over the long-term line.
//
// Conversions to and from year/month/day use Howard Hinnant's
// days_from_civil / civil_from_days algorithms, which are exact for every
// year including leap years and century rules.
//
// Thread model:
//   Value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct Date {
  std::int32_t days{0};  // Days since 1970-01-01 (may be negative)
};

// Broken-down calendar fields of a Date.
struct CivilDate {
  int year{1970};
  unsigned month{1};  // 1..12
  unsigned day{1};    // 1..31
};

inline bool operator==(Date a, Date b) { return a.days == b.days; }
inline bool operator!=(Date a, Date b) { return a.days != b.days; }
inline bool operator<(Date a, Date b) { return a.days < b.days; }
inline bool operator>(Date a, Date b) { return a.days > b.days; }
inline bool operator<=(Date a, Date b) { return a.days <= b.days; }
inline bool operator>=(Date a, Date b) { return a.days >= b.days; }

// Supported calendar years.
inline constexpr int kMinYear = 1;
inline constexpr int kMaxYear = 9999;

// -------------------------------------------------------------------------
// make_date(year, month, day)
// -------------------------------------------------------------------------
// @brief  Builds a Date from calendar fields.
//
// @throws std::invalid_argument if year is outside kMinYear..kMaxYear, month
//         is outside 1..12, or day is outside the valid range for that month
//         and year.
// -------------------------------------------------------------------------
Date make_date(int year, unsigned month, unsigned day);

// Calendar fields of a Date.
CivilDate to_civil(Date date);

// Calendar year of a Date.
int year_of(Date date);

// -------------------------------------------------------------------------
// days_between(a, b)
// -------------------------------------------------------------------------
// @brief  Absolute number of whole days between two dates.
//
// @details
// Order-independent: days_between(a, b) == days_between(b, a). Used for
// holding periods and the wash-sale window, both of which compare
// magnitudes only.
// -------------------------------------------------------------------------
int days_between(Date a, Date b);

// Signed day count from `from` to `to` (negative when `to` is earlier).
int signed_days(Date from, Date to);

// Formats as "YYYY-MM-DD".
std::string to_iso_string(Date date);

// -------------------------------------------------------------------------
// parse_iso_date(text)
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD", optionally followed by an ISO-8601 time part
//         ("T..." or " ..."), which is ignored.
//
// @return The Date, or std::nullopt for malformed text or an impossible
//         calendar day (e.g. 2023-02-29).
// -------------------------------------------------------------------------
std::optional<Date> parse_iso_date(std::string_view text);

}  // namespace domain
}  // namespace costbasis
