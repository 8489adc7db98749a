#include "stage_runner.hpp"

#include <algorithm>
#include <cstdlib>

#include "internal/similarity/similarity.hpp"
#include "internal/similarity/text_normalize.hpp"

namespace idsync::strategy {

namespace {

constexpr char kKeySeparator = '\x1f';

std::optional<std::string> PrepareKey(const KeyColumn& key, const model::Value& value) {
  if (key.as_date) {
    auto date = model::AsDate(value);
    if (!date) return std::nullopt;
    return date->ToString();
  }
  if (key.normalize) {
    if (const auto* text = std::get_if<std::string>(&value)) {
      auto normalized = similarity::NormalizeText(*text);
      if (normalized.empty()) return std::nullopt;
      return normalized;
    }
  }
  return model::CanonicalKey(value);
}

std::optional<std::string> PrepareText(TextForm form, const model::Value& value) {
  auto text = model::AsString(value);
  if (!text) return std::nullopt;

  auto prepared = form == TextForm::kTeamName ? similarity::NormalizeTeamName(*text) : similarity::NormalizeText(*text);
  if (prepared.empty()) return std::nullopt;
  return prepared;
}

void SortCandidates(std::vector<MatchCandidate>& candidates) {
  std::sort(candidates.begin(), candidates.end(), [](const MatchCandidate& a, const MatchCandidate& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.left_index != b.left_index) return a.left_index < b.left_index;
    return a.right_index < b.right_index;
  });
}

std::vector<MatchCandidate> CommitSorted(const std::vector<MatchCandidate>& sorted) {
  std::size_t left_size  = 0;
  std::size_t right_size = 0;
  for (const auto& candidate : sorted) {
    left_size  = std::max(left_size, candidate.left_index + 1);
    right_size = std::max(right_size, candidate.right_index + 1);
  }

  std::vector<MatchCandidate> committed;
  std::vector<bool>           used_left(left_size, false);
  std::vector<bool>           used_right(right_size, false);

  for (const auto& candidate : sorted) {
    if (used_left[candidate.left_index] || used_right[candidate.right_index]) continue;

    used_left[candidate.left_index]   = true;
    used_right[candidate.right_index] = true;
    committed.push_back(candidate);
  }
  return committed;
}

bool UsesHashJoin(const StageDescriptor& stage) {
  if (!stage.IsExactKey() || stage.keys.empty()) return false;
  return std::none_of(stage.keys.begin(), stage.keys.end(), [](const KeyColumn& key) { return key.nullable; });
}

// `taken` is indexed by record; `pool` keeps its order.
std::vector<std::size_t> Remove(const std::vector<std::size_t>& pool, const std::vector<bool>& taken) {
  std::vector<std::size_t> remaining;
  remaining.reserve(pool.size());
  for (auto index : pool) {
    if (!taken[index]) remaining.push_back(index);
  }
  return remaining;
}

} // namespace

// ------------------------------------------------------------
// PairScorer
// ------------------------------------------------------------

PairScorer::PairScorer(const StageDescriptor& stage, const RecordList& left, const RecordList& right)
    : stage_(stage), left_(Prepare(left, true)), right_(Prepare(right, false)) {
}

PairScorer::Side PairScorer::Prepare(const RecordList& records, bool left) const {
  Side side;

  side.keys.resize(stage_.keys.size());
  for (std::size_t k = 0; k < stage_.keys.size(); ++k) {
    side.keys[k].reserve(records.size());
    for (const auto* record : records) side.keys[k].push_back(PrepareKey(stage_.keys[k], record->Get(stage_.keys[k].name)));
  }

  if (stage_.date_tolerance) {
    side.dates.reserve(records.size());
    for (const auto* record : records) side.dates.push_back(model::AsDate(record->Get(stage_.date_tolerance->column)));
  }

  if (stage_.similarity) {
    for (const auto& [left_column, right_column] : stage_.similarity->field_pairs) {
      const auto& column = left ? left_column : right_column;
      if (side.text.count(column)) continue;

      auto& prepared = side.text[column];
      prepared.reserve(records.size());
      for (const auto* record : records) prepared.push_back(PrepareText(stage_.similarity->form, record->Get(column)));
    }
  }

  return side;
}

std::optional<std::string> PairScorer::JoinedKey(const Side& side, std::size_t index) const {
  std::string joined;
  for (const auto& column : side.keys) {
    if (!column[index]) return std::nullopt;
    joined += *column[index];
    joined += kKeySeparator;
  }
  return joined;
}

std::optional<std::string> PairScorer::LeftKey(std::size_t index) const {
  return JoinedKey(left_, index);
}

std::optional<std::string> PairScorer::RightKey(std::size_t index) const {
  return JoinedKey(right_, index);
}

std::optional<double> PairScorer::Score(std::size_t l, std::size_t r) const {
  for (std::size_t k = 0; k < stage_.keys.size(); ++k) {
    const auto& a = left_.keys[k][l];
    const auto& b = right_.keys[k][r];
    if (!a || !b) {
      if (stage_.keys[k].nullable) continue;
      return std::nullopt;
    }
    if (*a != *b) return std::nullopt;
  }

  std::optional<double> date_score;
  if (stage_.date_tolerance) {
    const auto& tolerance = *stage_.date_tolerance;
    const auto& a         = left_.dates[l];
    const auto& b         = right_.dates[r];
    if (!a || !b) {
      if (!tolerance.nullable) return std::nullopt;
    } else {
      const auto distance = std::llabs(similarity::DayOffset(*a, *b));
      const bool swapped =
          tolerance.allow_day_month_swap && (similarity::DateSwappedEqual(*a, *b) || similarity::DateSwappedEqual(*b, *a));
      if (distance > tolerance.days && !swapped) return std::nullopt;

      const double window = static_cast<double>(tolerance.days) + 1.0;
      date_score          = distance <= tolerance.days ? 1.0 - static_cast<double>(distance) / window : 1.0 / window;
    }
  }

  if (stage_.similarity) {
    const auto& rule = *stage_.similarity;
    double      best = -1.0;
    for (const auto& [left_column, right_column] : rule.field_pairs) {
      const auto& a = left_.text.at(left_column)[l];
      const auto& b = right_.text.at(right_column)[r];
      if (!a || !b) continue;

      if (rule.method == SimilarityMethod::kContainment && !similarity::ContainsNormalized(*a, *b)) continue;
      best = std::max(best, similarity::TokenCosine(*a, *b));
    }

    if (best < 0.0) return std::nullopt;
    if (rule.threshold && best < *rule.threshold) return std::nullopt;
    return best;
  }

  if (date_score) return date_score;
  return 1.0;
}

std::optional<double> ScorePair(const StageDescriptor& stage, const model::Record& left, const model::Record& right) {
  const RecordList left_list{&left};
  const RecordList right_list{&right};
  return PairScorer(stage, left_list, right_list).Score(0, 0);
}

// ------------------------------------------------------------
// Assignment
// ------------------------------------------------------------

std::vector<MatchCandidate> AssignGreedy(std::vector<MatchCandidate> candidates) {
  SortCandidates(candidates);
  return CommitSorted(candidates);
}

StageOutcome RunStage(const StageDescriptor&          stage,
                      int                             stage_number,
                      const RecordList&               left,
                      const std::vector<std::size_t>& left_pool,
                      const RecordList&               right,
                      const std::vector<std::size_t>& right_pool) {
  StageOutcome     outcome;
  const PairScorer scorer(stage, left, right);

  if (UsesHashJoin(stage)) {
    // equality partitioning: only records sharing a key are compared
    std::unordered_map<std::string, std::vector<std::size_t>> by_key;
    for (auto r : right_pool) {
      if (auto key = scorer.RightKey(r)) by_key[*key].push_back(r);
    }
    for (auto l : left_pool) {
      auto key = scorer.LeftKey(l);
      if (!key) continue;
      auto it = by_key.find(*key);
      if (it == by_key.end()) continue;
      for (auto r : it->second) outcome.candidates.push_back({l, r, 1.0, stage_number});
    }
  } else {
    for (auto l : left_pool) {
      for (auto r : right_pool) {
        if (auto score = scorer.Score(l, r)) outcome.candidates.push_back({l, r, *score, stage_number});
      }
    }
  }

  SortCandidates(outcome.candidates);
  outcome.committed = CommitSorted(outcome.candidates);
  return outcome;
}

PairOutcome RunStrategy(const MatchingStrategy& strategy,
                        const RecordList&       left,
                        const RecordList&       right,
                        const StageObserver&    observer) {
  PairOutcome outcome;
  for (std::size_t i = 0; i < left.size(); ++i) outcome.unmatched_left.push_back(i);
  for (std::size_t i = 0; i < right.size(); ++i) outcome.unmatched_right.push_back(i);

  for (std::size_t s = 0; s < strategy.stages.size(); ++s) {
    if (outcome.unmatched_left.empty() || outcome.unmatched_right.empty()) break;

    const auto& stage = strategy.stages[s];
    auto stage_outcome =
        RunStage(stage, static_cast<int>(s) + 1, left, outcome.unmatched_left, right, outcome.unmatched_right);
    if (stage_outcome.committed.empty()) continue;

    std::vector<bool> taken_left(left.size(), false);
    std::vector<bool> taken_right(right.size(), false);
    for (const auto& match : stage_outcome.committed) {
      taken_left[match.left_index]   = true;
      taken_right[match.right_index] = true;
      if (observer) observer(stage, match);
      outcome.matches.push_back(match);
    }
    outcome.unmatched_left  = Remove(outcome.unmatched_left, taken_left);
    outcome.unmatched_right = Remove(outcome.unmatched_right, taken_right);
  }

  return outcome;
}

} // namespace idsync::strategy
