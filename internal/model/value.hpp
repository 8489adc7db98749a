#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace idsync::model {

/*
  Proleptic Gregorian calendar date.

  Day arithmetic goes through ToDays()/FromDays(), which count days
  relative to 1970-01-01.
*/
struct Date {
  int      year  = 1970;
  unsigned month = 1;
  unsigned day   = 1;

  std::int64_t ToDays() const;
  static Date  FromDays(std::int64_t days);

  bool IsValid() const;

  // ISO-8601, YYYY-MM-DD
  std::string ToString() const;

  bool operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const Date& other) const {
    return !(*this == other);
  }
};

// Accepts YYYY-MM-DD, optionally followed by a time part ("T..." or " ...").
std::optional<Date> ParseDate(std::string_view text);

using Value = std::variant<std::monostate, std::string, std::int64_t, double, Date>;

inline bool IsNull(const Value& value) {
  return std::holds_alternative<std::monostate>(value);
}

/*
  Canonical text form used for key equality and grouping.

  Integral doubles print without a fraction so 10, 10.0 and "10" compare
  equal. Returns nullopt for null.
*/
std::optional<std::string> CanonicalKey(const Value& value);

std::optional<std::string> AsString(const Value& value);
std::optional<Date>        AsDate(const Value& value);

// Human readable, "null" for null. Used by logs and debug output.
std::string ToDisplayString(const Value& value);

} // namespace idsync::model
