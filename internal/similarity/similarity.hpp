#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "internal/model/value.hpp"

namespace idsync::similarity {

// Tokens shorter than this never count as contained.
constexpr std::size_t kMinContainmentTokenLength = 2;

/*
  Cosine similarity of token-frequency vectors built from NormalizeText(a)
  and NormalizeText(b). In [0, 1]; 0.0 when either side has no tokens.
*/
double TokenCosine(std::string_view a, std::string_view b);

/*
  True when a normalized token of `a` (length >= kMinContainmentTokenLength)
  is a substring of NormalizeText(b), or the other way round.
*/
bool ContainsNormalized(std::string_view a, std::string_view b);

// Signed day distance b - a.
std::int64_t DayOffset(const model::Date& a, const model::Date& b);

bool DateWithin(const model::Date& a, const model::Date& b, int days);

/*
  True when `a` with day and month exchanged equals `b`. Only defined for
  a.day <= 12; larger days always return false.
*/
bool DateSwappedEqual(const model::Date& a, const model::Date& b);

} // namespace idsync::similarity
