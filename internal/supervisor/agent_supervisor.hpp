#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "foreman/v1/agent.pb.h"
#include "internal/events/event_sink.hpp"
#include "internal/persistence/persistence_queue.hpp"
#include "internal/protocol/session_index.hpp"
#include "internal/protocol/stream_parser.hpp"
#include "internal/runs/run_store.hpp"
#include "process_launcher.hpp"
#include "statistics.hpp"
#include "worker_command.hpp"

namespace foreman::supervisor {

struct SpawnOptions {
  std::string working_dir;
  std::string model;
  std::string source = "manual";
  std::string pipeline_id;
};

/*
  AgentSupervisor

  Owns the table of worker processes. For each worker it runs one thread
  per output stream that parses lines, applies the resulting turn signal,
  buffers recent events and queues them for persistence.

  A worker leaves the live table when it is stopped or its process ends;
  its final snapshot stays queryable (GetInfo / GetStatistics / GetOutputs)
  until it ages out of the retired list.

  Locking: mutex_ guards the tables and every worker's mutable fields. It
  is never held across process I/O, persistence or notification delivery.
*/
class AgentSupervisor {
 public:
  static constexpr size_t kDefaultOutputBufferSize = 500;
  static constexpr size_t kRetiredWorkerLimit      = 256;

  AgentSupervisor(foreman::runtime::config::WorkerConfig config, std::shared_ptr<ProcessLauncher> launcher, std::shared_ptr<runs::RunStore> runs,
                  std::shared_ptr<persistence::PersistenceQueue> persistence, std::shared_ptr<events::EventSink> events);
  ~AgentSupervisor();

  AgentSupervisor(const AgentSupervisor&)            = delete;
  AgentSupervisor& operator=(const AgentSupervisor&) = delete;

  // Throws util::SpawnError.
  std::string Spawn(const SpawnOptions& options);

  // Throws util::NotFound for an unknown worker, util::InvalidState when it is no longer live.
  void SendInput(const std::string& agent_id, const std::string& text);

  // Idempotent for workers that already ended or crashed. Throws util::NotFound for unknown ids.
  void Stop(const std::string& agent_id);
  void StopAll();

  // Stops every worker and refuses new spawns.
  void Shutdown();

  std::optional<foreman::v1::AgentInfo> GetInfo(const std::string& agent_id) const;
  std::vector<foreman::v1::AgentInfo>   List() const;

  // Throws util::NotFound.
  AgentStatistics GetStatistics(const std::string& agent_id) const;

  // Most recent `limit` events, oldest first; 0 returns the whole buffer. Throws util::NotFound.
  std::vector<foreman::v1::OutputEvent> GetOutputs(const std::string& agent_id, size_t limit = 0) const;

  /*
    Blocks until the worker is WaitingForInput, Stopped or Error, or its
    current turn reported a failed result. Returns the status at that point,
    or the current one when `timeout` (0 = none) elapses. Throws util::NotFound.
  */
  foreman::v1::AgentStatus WaitForIdle(const std::string& agent_id, std::chrono::milliseconds timeout);

  // True when the turn started by the last SendInput ended in a non-success result. Throws util::NotFound.
  bool LastTurnFailed(const std::string& agent_id) const;

  std::optional<std::string> AgentForSession(const std::string& session_id) const;

  size_t LiveCount() const;

 private:
  struct Worker {
    // fixed at spawn, readable without the lock
    std::string                   agent_id;
    std::string                   pipeline_id;
    std::unique_ptr<ChildProcess> process;

    // guarded by AgentSupervisor::mutex_
    foreman::v1::AgentInfo               info;
    AgentStatistics                      stats;
    std::deque<foreman::v1::OutputEvent> recent;
    std::optional<std::string>           last_text;
    bool                                 turn_used_tool = false;
    bool                                 turn_failed    = false;
    bool                                 live           = true;
    std::string                          error_message;

    std::mutex  join_mutex;
    std::thread stdout_thread;
    std::thread stderr_thread;
  };

  using WorkerPtr = std::shared_ptr<Worker>;

  WorkerPtr FindLocked(const std::string& agent_id) const;

  void ReadStdout(WorkerPtr worker);
  void ReadStderr(WorkerPtr worker);

  void HandleLine(const WorkerPtr& worker, const protocol::StreamParser& parser, std::string_view line);
  void AppendLocked(Worker& worker, const foreman::v1::OutputEvent& event);
  void RecordEvent(const WorkerPtr& worker, const foreman::v1::OutputEvent& event);
  void OnProcessExit(const WorkerPtr& worker);
  void Retire(const WorkerPtr& worker);
  void JoinStreams(const WorkerPtr& worker);

  // Locked helpers: require mutex_ held. Return true when the status changed.
  bool SetStatusLocked(Worker& worker, foreman::v1::AgentStatus status);

  void EmitStatus(const foreman::v1::AgentInfo& info);
  void EmitStats(const std::string& agent_id, const AgentStatistics& stats);
  void EmitOutput(const foreman::v1::OutputEvent& event);
  void EmitInputRequired(const std::string& agent_id, const std::string& last_output);
  void EmitActivity(const std::string& agent_id, const std::string& prompt);

  void QueueRunUpdate(const std::string& agent_id, const char* label, runs::RunStore::Mutator mutate);
  void UpdateLiveGauge();

  WorkerCommand                                  command_;
  size_t                                         output_buffer_size_;
  std::chrono::milliseconds                      stop_grace_;
  std::shared_ptr<ProcessLauncher>               launcher_;
  std::shared_ptr<runs::RunStore>                runs_;
  std::shared_ptr<persistence::PersistenceQueue> persistence_;
  std::shared_ptr<events::EventSink>             events_;
  protocol::SessionIndex                         sessions_;

  mutable std::mutex               mutex_;
  std::condition_variable          status_cv_;
  std::map<std::string, WorkerPtr> workers_; // live
  std::map<std::string, WorkerPtr> retired_;
  std::deque<std::string>          retired_order_;
  bool                             shutting_down_ = false;
};

} // namespace foreman::supervisor
