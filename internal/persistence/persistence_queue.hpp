#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <deque>
#include <string>
#include <unordered_set>

#include "persistence_task.hpp"

namespace foreman::persistence {

/*
  Thread-safe blocking queue feeding the persistence workers.

  After Shutdown() the queue refuses new tasks but still hands out the ones
  already queued, so stopping drains instead of dropping.

  Tasks of one agent run in enqueue order: a task is only handed out while
  no other task of the same agent is in flight.
*/
class PersistenceQueue {
 public:
  // false once shut down
  bool Enqueue(PersistenceTask task);

  // blocking wait; nullopt when shut down and empty
  std::optional<PersistenceTask> Dequeue();

  // worker reports a dequeued task as finished
  void MarkDone(const PersistenceTask& task);

  // blocks until nothing is queued or in flight
  void WaitUntilIdle();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::condition_variable         idle_cv_;
  std::deque<PersistenceTask>     queue_;
  std::unordered_set<std::string> busy_agents_;
  std::size_t                     in_flight_ = 0;
  bool                            shutdown_  = false;

  // index of the first task that may run now, or queue_.size()
  std::size_t NextRunnable() const;
};

} // namespace foreman::persistence
