#include "strategies.hpp"

#include <algorithm>
#include <utility>

namespace idsync::strategy {

namespace {

const std::vector<std::string> kContextColumns = {"competition_id", "season_id"};

const std::vector<std::string> kPlayerJoinColumns = {"jersey_number", "team_id", "player_name"};

KeyColumn Key(std::string name) {
  KeyColumn key;
  key.name = std::move(name);
  return key;
}

SimilarityRule Cosine(TextForm form, std::vector<std::pair<std::string, std::string>> pairs, std::optional<double> threshold) {
  SimilarityRule rule;
  rule.method      = SimilarityMethod::kCosine;
  rule.form        = form;
  rule.field_pairs = std::move(pairs);
  rule.threshold   = threshold;
  return rule;
}

// name/nickname cross combinations
std::vector<std::pair<std::string, std::string>> PlayerNamePairs() {
  return {
      {"player_name", "player_name"},
      {"player_name", "player_nickname"},
      {"player_nickname", "player_name"},
      {"player_nickname", "player_nickname"},
  };
}

} // namespace

MatchingStrategy MatchStrategy(bool use_competition_context) {
  MatchingStrategy strategy;
  strategy.entity_type      = model::EntityType::kMatch;
  strategy.required_columns = {"match_date", "home_team_id", "away_team_id"};

  if (use_competition_context) {
    strategy.context_columns = kContextColumns;
    strategy.required_columns.insert(strategy.required_columns.end(), kContextColumns.begin(), kContextColumns.end());
    strategy.join_columns = {"match_date", "competition_id", "season_id", "home_team_id", "away_team_id"};
  } else {
    strategy.join_columns = {"match_date", "home_team_id", "away_team_id"};
  }

  KeyColumn match_date = Key("match_date");
  match_date.as_date   = true;

  StageDescriptor exact;
  exact.title = "exact date and teams";
  exact.keys  = {match_date, Key("home_team_id"), Key("away_team_id")};

  StageDescriptor shifted;
  shifted.title          = "teams with date within tolerance";
  shifted.keys           = {Key("home_team_id"), Key("away_team_id")};
  shifted.date_tolerance = DateTolerance{"match_date", kMatchDateToleranceDays, false, false};

  StageDescriptor matchday;
  matchday.title    = "matchday and teams";
  matchday.keys     = {Key("matchday"), Key("home_team_id"), Key("away_team_id")};
  matchday.fallback = true;

  strategy.stages = {exact, shifted, matchday};
  return strategy;
}

MatchingStrategy TeamStrategy(bool use_competition_context) {
  MatchingStrategy strategy;
  strategy.entity_type      = model::EntityType::kTeam;
  strategy.required_columns = {"team_name"};

  if (use_competition_context) {
    strategy.context_columns = kContextColumns;
    strategy.required_columns.insert(strategy.required_columns.end(), kContextColumns.begin(), kContextColumns.end());
    strategy.join_columns = {"team_name", "competition_id", "season_id"};
  } else {
    strategy.join_columns = {"team_name"};
  }

  KeyColumn name = Key("team_name");
  name.normalize = true;

  StageDescriptor exact;
  exact.title = "exact normalized name";
  exact.keys  = {name};

  StageDescriptor similar;
  similar.title      = "name similarity";
  similar.similarity = Cosine(TextForm::kTeamName, {{"team_name", "team_name"}}, kSimilarityThreshold);

  StageDescriptor best_remaining;
  best_remaining.title      = "best remaining name";
  best_remaining.similarity = Cosine(TextForm::kTeamName, {{"team_name", "team_name"}}, std::nullopt);
  best_remaining.fallback   = true;

  strategy.stages = {exact, similar, best_remaining};
  return strategy;
}

MatchingStrategy PlayerStrategy() {
  MatchingStrategy strategy;
  strategy.entity_type      = model::EntityType::kPlayer;
  strategy.required_columns = {"player_name", "team_id"};
  strategy.join_columns     = kPlayerJoinColumns;

  KeyColumn jersey = Key("jersey_number");
  jersey.nullable  = true;

  StageDescriptor name_jersey;
  name_jersey.title      = "name similarity, jersey and team";
  name_jersey.keys       = {jersey, Key("team_id")};
  name_jersey.similarity = Cosine(TextForm::kPlain, {{"player_name", "player_name"}}, kSimilarityThreshold);

  StageDescriptor birth_date;
  birth_date.title          = "birth date, team and name similarity";
  birth_date.keys           = {Key("team_id")};
  birth_date.date_tolerance = DateTolerance{"birth_date", kBirthDateToleranceDays, true, true};
  birth_date.similarity     = Cosine(TextForm::kPlain, PlayerNamePairs(), kSimilarityThreshold);

  StageDescriptor names;
  names.title      = "name or nickname similarity and team";
  names.keys       = {Key("team_id")};
  names.similarity = Cosine(TextForm::kPlain, PlayerNamePairs(), kSimilarityThreshold);

  StageDescriptor contained;
  contained.title              = "name containment and team";
  contained.keys               = {Key("team_id")};
  contained.similarity         = Cosine(TextForm::kPlain, PlayerNamePairs(), std::nullopt);
  contained.similarity->method = SimilarityMethod::kContainment;

  StageDescriptor best_remaining;
  best_remaining.title      = "best remaining name and team";
  best_remaining.keys       = {Key("team_id")};
  best_remaining.similarity = Cosine(TextForm::kPlain, PlayerNamePairs(), std::nullopt);
  best_remaining.fallback   = true;

  strategy.stages = {name_jersey, birth_date, names, contained, best_remaining};
  return strategy;
}

MatchingStrategy StrategyFor(model::EntityType type, bool use_competition_context) {
  switch (type) {
    case model::EntityType::kMatch:
      return MatchStrategy(use_competition_context);
    case model::EntityType::kTeam:
      return TeamStrategy(use_competition_context);
    case model::EntityType::kPlayer:
    default:
      return PlayerStrategy();
  }
}

std::vector<std::string> ReliablePlayerJoinColumns(const std::vector<model::SyncableContent>& contents) {
  std::vector<std::string> columns;
  for (const auto& column : kPlayerJoinColumns) {
    const bool reliable = std::all_of(contents.begin(), contents.end(), [&](const model::SyncableContent& content) {
      return std::all_of(content.records().begin(), content.records().end(), [&](const model::Record& record) {
        return !model::IsNull(record.Get(column));
      });
    });
    if (reliable) columns.push_back(column);
  }
  return columns;
}

} // namespace idsync::strategy
