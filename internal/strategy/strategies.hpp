#pragma once

#include <string>
#include <vector>

#include "internal/model/entity_type.hpp"
#include "internal/model/syncable_content.hpp"
#include "stage.hpp"

namespace idsync::strategy {

// Similarity cut-off of the thresholded text stages.
constexpr double kSimilarityThreshold = 0.75;

// Match stage 2 day window.
constexpr int kMatchDateToleranceDays = 3;

// Player stage 2 birth date window.
constexpr int kBirthDateToleranceDays = 1;

MatchingStrategy MatchStrategy(bool use_competition_context);
MatchingStrategy TeamStrategy(bool use_competition_context);
MatchingStrategy PlayerStrategy();

// Context only applies to matches and teams.
MatchingStrategy StrategyFor(model::EntityType type, bool use_competition_context);

/*
  Player join columns that every non-empty provider carries with a value on
  every record, in declaration order (jersey_number, team_id, player_name).
  May be empty.
*/
std::vector<std::string> ReliablePlayerJoinColumns(const std::vector<model::SyncableContent>& contents);

} // namespace idsync::strategy
