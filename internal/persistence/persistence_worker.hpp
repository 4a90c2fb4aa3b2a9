#pragma once

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "persistence_queue.hpp"

namespace foreman::persistence {

/*
  Background threads that execute queued history writes.

  Each task runs at most once. A failed write (non-OK result or exception)
  is logged and dropped; it never reaches the worker stream that queued it.
*/
class PersistenceWorker {
 public:
  PersistenceWorker(std::shared_ptr<PersistenceQueue> queue, std::size_t threads = 1);
  ~PersistenceWorker();

  PersistenceWorker(const PersistenceWorker&)            = delete;
  PersistenceWorker& operator=(const PersistenceWorker&) = delete;

  void Start();

  // drains what is already queued, then joins
  void Stop();

 private:
  void Run();

  std::shared_ptr<PersistenceQueue> queue_;
  std::size_t                       thread_count_;
  std::vector<std::thread>          threads_;
};

} // namespace foreman::persistence
