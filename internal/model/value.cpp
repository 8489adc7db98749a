#include "value.hpp"

#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

namespace idsync::model {

namespace {

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) return 29;
  return kDays[month - 1];
}

bool ParseDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

std::string FormatDouble(double value) {
  if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 9.0e15) {
    return std::to_string(static_cast<std::int64_t>(value));
  }
  std::ostringstream out;
  out.precision(std::numeric_limits<double>::max_digits10);
  out << value;
  return out.str();
}

} // namespace

// Days-from-civil, after Howard Hinnant's chrono date algorithms.
std::int64_t Date::ToDays() const {
  const int          y   = static_cast<int>(year) - (month <= 2 ? 1 : 0);
  const int          era = (y >= 0 ? y : y - 399) / 400;
  const unsigned     yoe = static_cast<unsigned>(y - era * 400);
  const unsigned     mp  = (month + 9) % 12;
  const unsigned     doy = (153 * mp + 2) / 5 + day - 1;
  const unsigned     doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Date Date::FromDays(std::int64_t days) {
  days += 719468;
  const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned     doe = static_cast<unsigned>(days - era * 146097);
  const unsigned     yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y   = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned     doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned     mp  = (5 * doy + 2) / 153;
  const unsigned     d   = doy - (153 * mp + 2) / 5 + 1;
  const unsigned     m   = mp < 10 ? mp + 3 : mp - 9;

  Date date;
  date.year  = static_cast<int>(y + (m <= 2 ? 1 : 0));
  date.month = m;
  date.day   = d;
  return date;
}

bool Date::IsValid() const {
  return month >= 1 && month <= 12 && day >= 1 && day <= DaysInMonth(year, month);
}

std::string Date::ToString() const {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, day);
  return buffer;
}

std::optional<Date> ParseDate(std::string_view text) {
  while (!text.empty() && text.front() == ' ') text.remove_prefix(1);

  int year = 0, month = 0, day = 0;
  if (!ParseDigits(text, 0, 4, year) || text.size() < 10 || text[4] != '-' || !ParseDigits(text, 5, 2, month) ||
      text[7] != '-' || !ParseDigits(text, 8, 2, day)) {
    return std::nullopt;
  }
  if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  Date date;
  date.year  = year;
  date.month = static_cast<unsigned>(month);
  date.day   = static_cast<unsigned>(day);
  if (!date.IsValid()) return std::nullopt;
  return date;
}

std::optional<std::string> CanonicalKey(const Value& value) {
  switch (value.index()) {
    case 1:
      return std::get<std::string>(value);
    case 2:
      return std::to_string(std::get<std::int64_t>(value));
    case 3:
      return FormatDouble(std::get<double>(value));
    case 4:
      return std::get<Date>(value).ToString();
    default:
      return std::nullopt;
  }
}

std::optional<std::string> AsString(const Value& value) {
  if (const auto* text = std::get_if<std::string>(&value)) return *text;
  return CanonicalKey(value);
}

std::optional<Date> AsDate(const Value& value) {
  if (const auto* date = std::get_if<Date>(&value)) return *date;
  if (const auto* text = std::get_if<std::string>(&value)) return ParseDate(*text);
  return std::nullopt;
}

std::string ToDisplayString(const Value& value) {
  auto key = CanonicalKey(value);
  return key ? *key : "null";
}

} // namespace idsync::model
