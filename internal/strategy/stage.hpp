#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/entity_type.hpp"

namespace idsync::strategy {

/*
  Declarative description of one matching stage.

  A stage is a predicate over a (left, right) record pair plus a score.
  Every part is optional; an empty descriptor matches everything with
  score 1.0. The predicate is the conjunction of:
    - keys:            column equality
    - date_tolerance:  date columns within a day window (or day/month swapped)
    - similarity:      best text similarity over field pairs, optionally
                       thresholded
  The score is the similarity score when there is one, otherwise a date
  closeness score when there is a tolerance, otherwise 1.0.
*/

struct KeyColumn {
  std::string name;

  // Dropped from the predicate when either side is null, instead of
  // disqualifying the pair.
  bool nullable = false;

  // Compare NormalizeText() of string values.
  bool normalize = false;

  // Compare as calendar dates; values that do not parse count as null.
  bool as_date = false;
};

struct DateTolerance {
  std::string column;
  int         days = 0;

  bool allow_day_month_swap = false;
  bool nullable             = false;
};

enum class SimilarityMethod : std::uint8_t {
  kCosine      = 1,
  kContainment = 2,
};

enum class TextForm : std::uint8_t {
  kPlain    = 1, // NormalizeText
  kTeamName = 2, // NormalizeTeamName
};

struct SimilarityRule {
  SimilarityMethod method = SimilarityMethod::kCosine;
  TextForm         form   = TextForm::kPlain;

  // (left column, right column); the best scoring pair wins.
  std::vector<std::pair<std::string, std::string>> field_pairs;

  // nullopt: any score is accepted.
  std::optional<double> threshold;
};

struct StageDescriptor {
  std::string title;

  std::vector<KeyColumn>        keys;
  std::optional<DateTolerance>  date_tolerance;
  std::optional<SimilarityRule> similarity;

  // Last-resort stage; accepts low-confidence pairings. Its links are
  // applied after those of every other stage.
  bool fallback = false;

  bool IsExactKey() const {
    return !date_tolerance && !similarity;
  }
};

/*
  Everything the engine needs to synchronize one entity type.
*/
struct MatchingStrategy {
  model::EntityType entity_type = model::EntityType::kMatch;

  // Columns every record has to carry (values may be null).
  std::vector<std::string> required_columns;

  // Partition columns, only filled in when the context switch is on.
  std::vector<std::string> context_columns;

  // Columns carried on result rows and used for deduplication.
  std::vector<std::string> join_columns;

  std::vector<StageDescriptor> stages;
};

} // namespace idsync::strategy
