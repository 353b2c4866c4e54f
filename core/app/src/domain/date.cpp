#include "costbasis/domain/date.hpp"

#include <cstdio>
#include <stdexcept>

namespace costbasis {
namespace domain {

namespace {

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned last_day_of_month(int year, unsigned month) {
  static constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30,
                                         31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];
}

bool is_valid_civil(int year, unsigned month, unsigned day) {
  return year >= kMinYear && year <= kMaxYear && month >= 1 && month <= 12 && day >= 1 &&
         day <= last_day_of_month(year, month);
}

// Howard Hinnant's days_from_civil: shifts the year to start in March so the
// leap day is the last day of the shifted year.
std::int32_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);           // [0, 399]
  const unsigned mp = m > 2 ? m - 3 : m + 9;                           // [0, 11]
  const unsigned doy = (153 * mp + 2) / 5 + d - 1;                     // [0, 365]
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;          // [0, 146096]
  return static_cast<std::int32_t>(era * 146097 +
                                   static_cast<int>(doe) - 719468);
}

bool parse_digits(std::string_view text, std::size_t pos, std::size_t count,
                  int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

}  // namespace

// -----------------------------------------------------------------------------
// make_date
// -----------------------------------------------------------------------------
Date make_date(int year, unsigned month, unsigned day) {
  if (!is_valid_civil(year, month, day)) {
    throw std::invalid_argument("Invalid calendar date: " +
                                std::to_string(year) + "-" +
                                std::to_string(month) + "-" +
                                std::to_string(day));
  }
  return Date{days_from_civil(year, month, day)};
}

// -----------------------------------------------------------------------------
// to_civil: Howard Hinnant's civil_from_days
// -----------------------------------------------------------------------------
CivilDate to_civil(Date date) {
  const int z = date.days + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe =
      (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;

  CivilDate civil;
  civil.year = y + (m <= 2 ? 1 : 0);
  civil.month = m;
  civil.day = d;
  return civil;
}

int year_of(Date date) { return to_civil(date).year; }

int days_between(Date a, Date b) {
  const int diff = b.days - a.days;
  return diff < 0 ? -diff : diff;
}

int signed_days(Date from, Date to) { return to.days - from.days; }

std::string to_iso_string(Date date) {
  const CivilDate c = to_civil(date);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.year, c.month, c.day);
  return std::string(buf);
}

// -----------------------------------------------------------------------------
// parse_iso_date
// -----------------------------------------------------------------------------
std::optional<Date> parse_iso_date(std::string_view text) {
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) ||
      !parse_digits(text, 8, 2, day)) {
    return std::nullopt;
  }

  if (!is_valid_civil(year, static_cast<unsigned>(month),
                      static_cast<unsigned>(day))) {
    return std::nullopt;
  }
  return Date{days_from_civil(year, static_cast<unsigned>(month),
                              static_cast<unsigned>(day))};
}

}  // namespace domain
}  // namespace costbasis
