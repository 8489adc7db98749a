#include "internal/batch/batch_runner.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/batch/group_queue.hpp"

namespace {

using idsync::batch::BatchRunner;
using idsync::batch::SyncGroup;
using idsync::model::EntityType;
using idsync::model::Record;
using idsync::model::SyncableContent;

SyncGroup TeamGroup(const std::string& name, const std::string& team) {
  SyncGroup group;
  group.name        = name;
  group.entity_type = EntityType::kTeam;
  group.contents    = {
      SyncableContent(EntityType::kTeam, "a", {Record{{"a_team_id", std::int64_t{1}}, {"team_name", team}}}),
      SyncableContent(EntityType::kTeam, "b", {Record{{"b_team_id", std::int64_t{2}}, {"team_name", team}}}),
  };
  return group;
}

void TestResultsKeepGroupOrder() {
  std::vector<SyncGroup> groups;
  for (int i = 0; i < 12; ++i) groups.push_back(TeamGroup("group-" + std::to_string(i), "Team " + std::to_string(i)));

  BatchRunner runner(4, {});
  const auto  results = runner.Run(groups);

  assert(results.size() == groups.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    assert(results[i].name == groups[i].name);
    assert(results[i].ok());
    assert(results[i].table->size() == 1);
    assert(results[i].table->rows()[0].IdCount() == 2);
  }
}

void TestFailingGroupIsIsolated() {
  auto broken = TeamGroup("broken", "Lyon");
  broken.contents[1] = SyncableContent(EntityType::kTeam, "a", {});

  std::vector<SyncGroup> groups = {TeamGroup("first", "Lyon"), broken, TeamGroup("last", "Lens")};

  BatchRunner runner(2, {});
  const auto  results = runner.Run(groups);

  assert(results[0].ok());
  assert(!results[1].ok());
  assert(results[1].name == "broken");
  assert(!results[1].error.empty());
  assert(results[2].ok());
}

void TestThreadCountFromConfig() {
  idsync::runtime::config::RuntimeConfig config;
  assert(BatchRunner(config).threads() == 1);

  config.mutable_workers()->set_threads(3);
  assert(BatchRunner(config).threads() == 3);

  BatchRunner runner(0, {});
  assert(runner.threads() == 1);
  assert(runner.Run({}).empty());
}

void TestQueueDrainsAfterShutdown() {
  SyncGroup                 group = TeamGroup("g", "Nice");
  idsync::batch::GroupQueue queue;
  queue.Enqueue({0, &group});
  queue.Enqueue({1, &group});
  queue.Shutdown();

  assert(queue.Dequeue()->index == 0);
  assert(queue.Dequeue()->index == 1);
  assert(!queue.Dequeue().has_value());
}

} // namespace

int main() {
  TestResultsKeepGroupOrder();
  TestFailingGroupIsIsolated();
  TestThreadCountFromConfig();
  TestQueueDrainsAfterShutdown();

  std::cout << "idsync_unit_batch_runner: pass\n";
  return 0;
}
