#include "persistence_queue.hpp"

namespace foreman::persistence {

bool PersistenceQueue::Enqueue(PersistenceTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::size_t PersistenceQueue::NextRunnable() const {
  for (std::size_t i = 0; i < queue_.size(); ++i) {
    const auto& agent_id = queue_[i].agent_id;
    if (agent_id.empty() || busy_agents_.count(agent_id) == 0) return i;
  }
  return queue_.size();
}

std::optional<PersistenceTask> PersistenceQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  std::size_t index = 0;
  cv_.wait(lock, [&] {
    index = NextRunnable();
    return index < queue_.size() || (shutdown_ && queue_.empty());
  });

  if (queue_.empty()) return std::nullopt;

  PersistenceTask task = std::move(queue_[index]);
  queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(index));
  if (!task.agent_id.empty()) busy_agents_.insert(task.agent_id);
  ++in_flight_;
  return task;
}

void PersistenceQueue::MarkDone(const PersistenceTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
    busy_agents_.erase(task.agent_id);
  }
  // a task held back behind this agent may be runnable now
  cv_.notify_all();
  idle_cv_.notify_all();
}

void PersistenceQueue::WaitUntilIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return queue_.empty() && in_flight_ == 0; });
}

void PersistenceQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t PersistenceQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size() + in_flight_;
}

} // namespace foreman::persistence
