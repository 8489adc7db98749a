#pragma once

#include <string>
#include <vector>

#include "internal/model/entity_type.hpp"
#include "internal/model/result_table.hpp"
#include "internal/model/syncable_content.hpp"
#include "internal/strategy/stage.hpp"

namespace idsync::runtime::config {
class RuntimeConfig;
}

namespace idsync::engine {

struct SyncOptions {
  // Partition matches and teams by (competition_id, season_id).
  bool use_competition_context = false;

  // Log every committed pair at info level.
  bool verbose = false;
};

SyncOptions OptionsFromConfig(const idsync::runtime::config::RuntimeConfig& config);

/*
  Synchronizes one group of provider contents for one entity type.

  The constructor validates the input and throws util::ConfigurationError
  (or a subclass) on:
    - content of another entity type, an empty or repeated provider tag
    - a record missing a required column or its identifier column
    - a null or repeated identifier within one provider
    - players with no usable join column

  Synchronize() runs three layers:
    1. every provider pair, full pools; the committed pairs of all provider
       pairs are linked together, strongest stage first
    2. stage by stage across every provider pair, over the records whose row
       does not yet span every provider of the partition; a record leaves
       the pool once it is linked
    3. every record still unplaced becomes its own row
  and then deduplicates the rows by the entity's join columns.

  Providers are processed in ascending tag order; result columns keep the
  input order. Synchronize() does not modify the engine.
*/
class SyncEngine {
 public:
  SyncEngine(model::EntityType type, std::vector<model::SyncableContent> contents, SyncOptions options = {});

  model::ResultTable Synchronize() const;

  model::EntityType entity_type() const {
    return type_;
  }
  const strategy::MatchingStrategy& strategy() const {
    return strategy_;
  }
  const std::vector<model::SyncableContent>& contents() const {
    return contents_;
  }
  const SyncOptions& options() const {
    return options_;
  }

 private:
  void Validate();

  model::EntityType                   type_;
  std::vector<model::SyncableContent> contents_;
  SyncOptions                         options_;
  strategy::MatchingStrategy          strategy_;
};

} // namespace idsync::engine
