#include "similarity.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

#include "text_normalize.hpp"

namespace idsync::similarity {

namespace {

std::map<std::string, int> CountTokens(std::string_view text) {
  std::map<std::string, int> counts;
  for (auto& token : Tokenize(text)) ++counts[std::move(token)];
  return counts;
}

bool AnyTokenContained(std::string_view tokens_of, const std::string& haystack) {
  for (const auto& token : Tokenize(tokens_of)) {
    if (token.size() < kMinContainmentTokenLength) continue;
    if (haystack.find(token) != std::string::npos) return true;
  }
  return false;
}

} // namespace

double TokenCosine(std::string_view a, std::string_view b) {
  const auto left  = CountTokens(a);
  const auto right = CountTokens(b);
  if (left.empty() || right.empty()) return 0.0;

  double dot        = 0.0;
  double left_norm  = 0.0;
  double right_norm = 0.0;
  for (const auto& [token, count] : left) {
    left_norm += static_cast<double>(count) * count;
    auto it = right.find(token);
    if (it != right.end()) dot += static_cast<double>(count) * it->second;
  }
  for (const auto& entry : right) right_norm += static_cast<double>(entry.second) * entry.second;

  // sqrt of the product keeps identical vectors at exactly 1.0
  const double score = dot / std::sqrt(left_norm * right_norm);
  return std::clamp(score, 0.0, 1.0);
}

bool ContainsNormalized(std::string_view a, std::string_view b) {
  const std::string normalized_a = NormalizeText(a);
  const std::string normalized_b = NormalizeText(b);
  if (normalized_a.empty() || normalized_b.empty()) return false;

  return AnyTokenContained(normalized_a, normalized_b) || AnyTokenContained(normalized_b, normalized_a);
}

std::int64_t DayOffset(const model::Date& a, const model::Date& b) {
  return b.ToDays() - a.ToDays();
}

bool DateWithin(const model::Date& a, const model::Date& b, int days) {
  const auto offset = DayOffset(a, b);
  return (offset < 0 ? -offset : offset) <= days;
}

bool DateSwappedEqual(const model::Date& a, const model::Date& b) {
  if (a.day > 12) return false;

  model::Date swapped;
  swapped.year  = a.year;
  swapped.month = a.day;
  swapped.day   = a.month;
  return swapped.IsValid() && swapped == b;
}

} // namespace idsync::similarity
