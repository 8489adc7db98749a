#pragma once

#include <memory>
#include <thread>
#include <vector>

#include "group_queue.hpp"
#include "internal/engine/sync_engine.hpp"

namespace idsync::batch {

/*
  Background worker that synchronizes queued groups.

  Each result is written to its own slot of `results`, which is sized by
  the runner before any worker starts.
*/
class GroupWorker {
 public:
  GroupWorker(std::shared_ptr<GroupQueue> queue, engine::SyncOptions options, std::vector<GroupResult>* results);
  ~GroupWorker();

  GroupWorker(const GroupWorker&)            = delete;
  GroupWorker& operator=(const GroupWorker&) = delete;

  void Start();

  // Returns once the queue is shut down and drained.
  void Join();

 private:
  void Run();

  std::shared_ptr<GroupQueue> queue_;
  engine::SyncOptions         options_;
  std::vector<GroupResult>*   results_;

  std::thread thread_;
};

} // namespace idsync::batch
