#include "batch_runner.hpp"

#include <algorithm>
#include <memory>

#include "config/config.pb.h"
#include "group_worker.hpp"
#include "internal/observability/logging.hpp"

namespace idsync::batch {

BatchRunner::BatchRunner(std::size_t threads, engine::SyncOptions options)
    : threads_(std::max<std::size_t>(threads, 1)), options_(options) {
}

BatchRunner::BatchRunner(const idsync::runtime::config::RuntimeConfig& config)
    : BatchRunner(config.workers().threads(), engine::OptionsFromConfig(config)) {
}

std::vector<GroupResult> BatchRunner::Run(const std::vector<SyncGroup>& groups) const {
  std::vector<GroupResult> results(groups.size());
  if (groups.empty()) return results;

  auto queue = std::make_shared<GroupQueue>();
  for (std::size_t i = 0; i < groups.size(); ++i) {
    queue->Enqueue(GroupTask{i, &groups[i]});
  }
  // workers drain what is queued, then stop
  queue->Shutdown();

  const auto worker_count = std::min(threads_, groups.size());

  std::vector<std::unique_ptr<GroupWorker>> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.push_back(std::make_unique<GroupWorker>(queue, options_, &results));
    workers.back()->Start();
  }
  for (auto& worker : workers) worker->Join();

  const auto failed = std::count_if(results.begin(), results.end(), [](const GroupResult& r) { return !r.ok(); });
  if (failed > 0) {
    IDSYNC_LOG_WARN("batch finished with failed groups",
                    {observability::IntField("groups", static_cast<std::int64_t>(groups.size())),
                     observability::IntField("failed", static_cast<std::int64_t>(failed))});
  }
  return results;
}

} // namespace idsync::batch
