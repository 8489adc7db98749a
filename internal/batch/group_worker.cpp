#include "group_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace idsync::batch {

GroupWorker::GroupWorker(std::shared_ptr<GroupQueue> queue,
                         engine::SyncOptions         options,
                         std::vector<GroupResult>*   results)
    : queue_(std::move(queue)), options_(options), results_(results) {
}

GroupWorker::~GroupWorker() {
  Join();
}

void GroupWorker::Start() {
  thread_ = std::thread(&GroupWorker::Run, this);
}

void GroupWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void GroupWorker::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    auto& result = (*results_)[task->index];
    result.name  = task->group->name;

    try {
      engine::SyncEngine engine(task->group->entity_type, task->group->contents, options_);
      result.table = engine.Synchronize();
    } catch (const std::exception& e) {
      result.error = e.what();
      IDSYNC_LOG_ERROR("group synchronization failed",
                       {observability::StringField("group", task->group->name),
                        observability::StringField("error", e.what())});
    }
  }
}

} // namespace idsync::batch
