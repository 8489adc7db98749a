#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "idsync/v1.hpp"

namespace {

using idsync::model::Date;
using idsync::model::EntityType;
using idsync::model::Record;
using idsync::model::SyncableContent;

Record MatchRecord(const std::string& id_field, std::int64_t id, Date date, std::int64_t home, std::int64_t away) {
  return Record{{id_field, id}, {"match_date", date}, {"home_team_id", home}, {"away_team_id", away}};
}

void PrintTable(const idsync::model::ResultTable& table) {
  for (const auto& column : table.id_columns()) std::cout << column << '\t';
  std::cout << '\n';
  for (const auto& row : table.rows()) {
    for (const auto& id : row.ids) std::cout << (id ? *id : "-") << '\t';
    std::cout << '\n';
  }
}

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config path, otherwise defaults with verbose tracing.
  idsync::runtime::config::RuntimeConfig config;
  try {
    if (argc > 1) {
      config = idsync::config::ConfigLoader::LoadFromYaml(argv[1]);
    } else {
      config.mutable_engine()->set_verbose(true);
    }
  } catch (const std::exception& e) {
    std::cerr << "config: " << e.what() << '\n';
    return 1;
  }
  idsync::observability::InitializeLogging(config);

  SyncableContent opta(EntityType::kMatch, "opta");
  opta.Append({MatchRecord("opta_match_id", 100, Date{2024, 3, 2}, 1, 2),
               MatchRecord("opta_match_id", 101, Date{2024, 3, 9}, 3, 4)});

  SyncableContent wyscout(EntityType::kMatch, "wyscout");
  wyscout.Append({MatchRecord("wyscout_match_id", 7, Date{2024, 3, 2}, 1, 2),
                  MatchRecord("wyscout_match_id", 8, Date{2024, 3, 11}, 3, 4)});

  idsync::batch::SyncGroup group;
  group.name        = "example";
  group.entity_type = EntityType::kMatch;
  group.contents    = {opta, wyscout};

  idsync::batch::BatchRunner runner(config);
  auto                       results = runner.Run({group});

  int status = 0;
  for (const auto& result : results) {
    if (!result.ok()) {
      std::cerr << result.name << ": " << result.error << '\n';
      status = 2;
      continue;
    }
    PrintTable(*result.table);
  }

  idsync::observability::ShutdownLogging();
  return status;
}
