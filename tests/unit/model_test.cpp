#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/record.hpp"
#include "internal/model/result_table.hpp"
#include "internal/model/syncable_content.hpp"
#include "internal/model/value.hpp"
#include "internal/util/errors.hpp"

namespace {

using idsync::model::CanonicalKey;
using idsync::model::Date;
using idsync::model::EntityType;
using idsync::model::ParseDate;
using idsync::model::Record;
using idsync::model::ResultRow;
using idsync::model::ResultTable;
using idsync::model::SyncableContent;
using idsync::model::Value;

void TestDateDayArithmeticRoundTrips() {
  assert(Date{}.ToDays() == 0);
  assert((Date{2000, 3, 1}.ToDays() - Date{2000, 2, 28}.ToDays()) == 2);
  assert((Date{1900, 3, 1}.ToDays() - Date{1900, 2, 28}.ToDays()) == 1);

  const Date leap{2024, 2, 29};
  assert(Date::FromDays(leap.ToDays()) == leap);
  assert(Date::FromDays(leap.ToDays() + 1) == (Date{2024, 3, 1}));
  assert(Date::FromDays(-1) == (Date{1969, 12, 31}));
}

void TestParseDateAcceptsTimestamps() {
  assert(ParseDate("2024-05-17") == (Date{2024, 5, 17}));
  assert(ParseDate("2024-05-17T18:30:00Z") == (Date{2024, 5, 17}));
  assert(ParseDate("2024-05-17 18:30") == (Date{2024, 5, 17}));

  assert(!ParseDate("2024-02-30"));
  assert(!ParseDate("17/05/2024"));
  assert(!ParseDate("2024-05-17x"));
  assert(!ParseDate(""));
}

void TestCanonicalKeyUnifiesNumbers() {
  assert(CanonicalKey(Value{std::int64_t{10}}) == std::string("10"));
  assert(CanonicalKey(Value{10.0}) == std::string("10"));
  assert(CanonicalKey(Value{std::string("10")}) == std::string("10"));
  assert(CanonicalKey(Value{10.5}) == std::string("10.5"));
  assert(CanonicalKey(Value{Date{2023, 1, 9}}) == std::string("2023-01-09"));
  assert(!CanonicalKey(Value{}));

  assert(idsync::model::AsDate(Value{std::string("2023-01-09")}) == (Date{2023, 1, 9}));
  assert(!idsync::model::AsDate(Value{std::int64_t{20230109}}));
  assert(idsync::model::ToDisplayString(Value{}) == "null");
}

void TestRecordFieldOperations() {
  Record record{{"a", std::int64_t{1}}, {"b", std::string("x")}};
  assert(record.Has("a"));
  assert(!record.Has("c"));
  assert(idsync::model::IsNull(record.Get("c")));

  record.Set("a", std::string("replaced"));
  assert(std::get<std::string>(record.Get("a")) == "replaced");
  assert(record.fields().size() == 2);

  assert(record.Rename("b", "a"));
  assert(record.fields().size() == 1);
  assert(std::get<std::string>(record.Get("a")) == "x");

  assert(!record.Rename("missing", "z"));
  assert(record.Erase("a"));
  assert(!record.Erase("a"));
}

void TestAppendRequiresSameEntityType() {
  SyncableContent teams(EntityType::kTeam, "opta", {Record{{"opta_team_id", std::int64_t{1}}}});
  SyncableContent more(EntityType::kTeam, "other", {Record{{"opta_team_id", std::int64_t{2}}}});
  teams.Append(more);
  assert(teams.size() == 2);
  assert(teams.provider() == "opta");

  SyncableContent players(EntityType::kPlayer, "opta");
  bool            threw = false;
  try {
    teams.Append(players);
  } catch (const idsync::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestTransformProviderFieldsRenamesLongFormatId() {
  SyncableContent content(EntityType::kPlayer,
                          "statsbomb",
                          {Record{{"provider", std::string("statsbomb")},
                                  {"provider_player_id", std::int64_t{44}},
                                  {"player_name", std::string("Ada Hegerberg")}},
                           Record{{"statsbomb_player_id", std::int64_t{45}}}});
  assert(content.IdField() == "statsbomb_player_id");

  content.TransformProviderFields();

  const auto& first = content.records()[0];
  assert(!first.Has("provider"));
  assert(!first.Has("provider_player_id"));
  assert(std::get<std::int64_t>(first.Get("statsbomb_player_id")) == 44);
  assert(first.Has("player_name"));

  const auto& second = content.records()[1];
  assert(second.fields().size() == 1);
}

void TestTransformProviderFieldsWithCustomColumn() {
  SyncableContent content(EntityType::kTeam,
                          "opta",
                          {Record{{"source", std::string("opta")},
                                  {"provider_team_id", std::string("t9")},
                                  {"team_name", std::string("Arsenal")}},
                           Record{{"opta_team_id", std::string("t10")}, {"team_name", std::string("Chelsea")}}});

  content.TransformProviderFields("source");

  const auto& first = content.records()[0];
  assert(!first.Has("source"));
  assert(!first.Has("provider_team_id"));
  assert(std::get<std::string>(first.Get("opta_team_id")) == "t9");
  assert(first.Has("team_name"));

  const auto& second = content.records()[1];
  assert(std::get<std::string>(second.Get("opta_team_id")) == "t10");
  assert(second.fields().size() == 2);
}

void TestResultTableLookups() {
  ResultTable table(EntityType::kTeam, {"opta", "wyscout"}, {"team_name"});
  assert(table.id_columns()[0] == "opta_team_id");
  assert(table.id_columns()[1] == "wyscout_team_id");

  ResultRow row;
  row.ids         = {std::string("1"), std::nullopt};
  row.join_values = {Value{std::string("Arsenal")}};
  table.AddRow(row);

  assert(table.FindById("opta", "1") != nullptr);
  assert(table.FindById("wyscout", "1") == nullptr);
  assert(table.FindById("unknown", "1") == nullptr);
  assert(!table.IdOf(table.rows()[0], "wyscout"));
  assert(std::get<std::string>(table.JoinValue(table.rows()[0], "team_name")) == "Arsenal");

  ResultRow empty;
  empty.ids         = {std::nullopt, std::nullopt};
  empty.join_values = {Value{}};
  bool threw        = false;
  try {
    table.AddRow(empty);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDateDayArithmeticRoundTrips();
  TestParseDateAcceptsTimestamps();
  TestCanonicalKeyUnifiesNumbers();
  TestRecordFieldOperations();
  TestAppendRequiresSameEntityType();
  TestTransformProviderFieldsRenamesLongFormatId();
  TestTransformProviderFieldsWithCustomColumn();
  TestResultTableLookups();

  std::cout << "idsync_unit_model: pass\n";
  return 0;
}
