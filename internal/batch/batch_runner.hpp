#pragma once

#include <cstddef>
#include <vector>

#include "group_task.hpp"
#include "internal/engine/sync_engine.hpp"

namespace idsync::runtime::config {
class RuntimeConfig;
}

namespace idsync::batch {

/*
  Synchronizes independent groups on a fixed pool of worker threads.

  A failing group records its error in its own GroupResult; the other
  groups are unaffected.
*/
class BatchRunner {
 public:
  BatchRunner(std::size_t threads, engine::SyncOptions options);
  explicit BatchRunner(const idsync::runtime::config::RuntimeConfig& config);

  // One result per group, in input order.
  std::vector<GroupResult> Run(const std::vector<SyncGroup>& groups) const;

  std::size_t threads() const {
    return threads_;
  }

 private:
  std::size_t         threads_;
  engine::SyncOptions options_;
};

} // namespace idsync::batch
