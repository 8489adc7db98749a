#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/record.hpp"
#include "stage.hpp"

namespace idsync::strategy {

using RecordList = std::vector<const model::Record*>;

/*
  A proposed pairing. Indices point into the RecordList handed to the
  runner, `stage` is 1-based.
*/
struct MatchCandidate {
  std::size_t left_index  = 0;
  std::size_t right_index = 0;
  double      score       = 0.0;
  int         stage       = 0;
};

/*
  Evaluates one stage over a left/right record list.

  Per-record inputs (normalized keys, parsed dates, prepared text) are
  computed once up front, so scoring a pair does no parsing.
*/
class PairScorer {
 public:
  PairScorer(const StageDescriptor& stage, const RecordList& left, const RecordList& right);

  // nullopt when the pair fails the stage predicate.
  std::optional<double> Score(std::size_t left_index, std::size_t right_index) const;

  // Joined key of a record, nullopt when a non-nullable key is null.
  std::optional<std::string> LeftKey(std::size_t index) const;
  std::optional<std::string> RightKey(std::size_t index) const;

 private:
  struct Side {
    std::vector<std::vector<std::optional<std::string>>> keys;  // [key column][record]
    std::vector<std::optional<model::Date>>              dates; // [record]
    std::unordered_map<std::string, std::vector<std::optional<std::string>>> text; // column -> [record]
  };

  Side                       Prepare(const RecordList& records, bool left) const;
  std::optional<std::string> JoinedKey(const Side& side, std::size_t index) const;

  const StageDescriptor& stage_;
  Side                   left_;
  Side                   right_;
};

// Convenience for a single pair.
std::optional<double> ScorePair(const StageDescriptor& stage, const model::Record& left, const model::Record& right);

/*
  Greedy one-to-one assignment: highest score first, ties by left index
  then right index. A candidate is committed when neither endpoint has been
  committed yet.
*/
std::vector<MatchCandidate> AssignGreedy(std::vector<MatchCandidate> candidates);

struct StageOutcome {
  // Every candidate, in acceptance order.
  std::vector<MatchCandidate> candidates;
  std::vector<MatchCandidate> committed;
};

StageOutcome RunStage(const StageDescriptor& stage,
                      int                    stage_number,
                      const RecordList&      left,
                      const std::vector<std::size_t>& left_pool,
                      const RecordList&      right,
                      const std::vector<std::size_t>& right_pool);

struct PairOutcome {
  std::vector<MatchCandidate> matches;
  std::vector<std::size_t>    unmatched_left;
  std::vector<std::size_t>    unmatched_right;
};

using StageObserver = std::function<void(const StageDescriptor&, const MatchCandidate&)>;

/*
  Runs the strategy's stages in order over one provider pair. Records
  committed by a stage are removed from the pools before the next stage.
*/
PairOutcome RunStrategy(const MatchingStrategy& strategy,
                        const RecordList&       left,
                        const RecordList&       right,
                        const StageObserver&    observer = {});

} // namespace idsync::strategy
