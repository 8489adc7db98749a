#include "group_queue.hpp"

namespace idsync::batch {

void GroupQueue::Enqueue(const GroupTask& task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<GroupTask> GroupQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  GroupTask task = queue_.front();
  queue_.pop();
  return task;
}

void GroupQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace idsync::batch
