#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity_type.hpp"
#include "internal/model/result_table.hpp"
#include "internal/model/syncable_content.hpp"

namespace idsync::batch {

/*
  One independent synchronization unit: all providers' contents of one
  entity type for one group (a competition season, a team roster, ...).
*/
struct SyncGroup {
  std::string                         name;
  model::EntityType                   entity_type = model::EntityType::kMatch;
  std::vector<model::SyncableContent> contents;
};

/*
  A queued group. `group` is owned by the caller of BatchRunner::Run and
  outlives the task.
*/
struct GroupTask {
  std::size_t      index = 0;
  const SyncGroup* group = nullptr;
};

struct GroupResult {
  std::string                       name;
  std::optional<model::ResultTable> table;
  // set when the group failed; table is empty then
  std::string error;

  bool ok() const {
    return table.has_value();
  }
};

} // namespace idsync::batch
