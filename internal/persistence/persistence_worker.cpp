#include "persistence_worker.hpp"

#include "internal/observability/logging.hpp"

namespace foreman::persistence {

PersistenceWorker::PersistenceWorker(std::shared_ptr<PersistenceQueue> queue, std::size_t threads)
    : queue_(std::move(queue)), thread_count_(threads == 0 ? 1 : threads) {
}

PersistenceWorker::~PersistenceWorker() {
  Stop();
}

void PersistenceWorker::Start() {
  if (!threads_.empty()) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&PersistenceWorker::Run, this);
  }
}

void PersistenceWorker::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void PersistenceWorker::Run() {
  for (;;) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      auto result = task->run();
      if (!result) {
        FOREMAN_LOG_WARN("history write failed", {observability::StringField("task", task->label), observability::StringField("agent_id", task->agent_id),
                                                  observability::StringField("code", db::ErrorCodeName(result.code)),
                                                  observability::StringField("error", result.message)});
      }
    } catch (const std::exception& e) {
      FOREMAN_LOG_WARN("history write threw", {observability::StringField("task", task->label), observability::StringField("agent_id", task->agent_id),
                                               observability::StringField("error", e.what())});
    }
    queue_->MarkDone(*task);
  }
}

} // namespace foreman::persistence
