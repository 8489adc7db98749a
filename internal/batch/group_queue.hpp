#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "group_task.hpp"

namespace idsync::batch {

/*
  Thread-safe blocking queue for group workers.
*/
class GroupQueue {
 public:
  void Enqueue(const GroupTask& task);

  // blocking wait; nullopt once shut down and drained
  std::optional<GroupTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<GroupTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace idsync::batch
