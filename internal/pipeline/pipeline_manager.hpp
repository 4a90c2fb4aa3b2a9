#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/events/event_sink.hpp"
#include "pipeline.hpp"
#include "step_executor.hpp"

namespace foreman::pipeline {

struct PipelineOptions {
  uint32_t default_max_iterations = 3; // used when a request asks for 0; 0 here means unbounded
  bool     skip_skill_synthesis   = false;
};

/*
  PipelineManager

  Owns the pipeline table and drives every pipeline on its own thread
  through plan -> build -> verify until a terminal decision. Steps of one
  pipeline never overlap; the previous step's worker is stopped before the
  next one is spawned.

  mutex_ guards the table and every pipeline's fields; it is never held
  while a step runs. Readers receive copies.
*/
class PipelineManager {
 public:
  PipelineManager(std::shared_ptr<StepExecutor> executor, std::shared_ptr<events::EventSink> events, PipelineOptions options);
  ~PipelineManager();

  PipelineManager(const PipelineManager&)            = delete;
  PipelineManager& operator=(const PipelineManager&) = delete;

  // Throws util::InvalidState after Shutdown.
  std::string Submit(std::string user_request, std::string working_dir, uint32_t max_iterations);

  std::optional<Pipeline> Get(const std::string& pipeline_id) const;
  std::vector<Pipeline>   List() const;

  /*
    Fails the pipeline with reason "cancelled" and stops its workers.
    Throws util::NotFound for an unknown id and util::InvalidState when the
    pipeline already finished.
  */
  void Cancel(const std::string& pipeline_id);

  // Blocks until the pipeline is terminal or `timeout` (0 = none) elapses. Returns whether it finished.
  bool WaitForCompletion(const std::string& pipeline_id, std::chrono::milliseconds timeout) const;

  // Cancels every running pipeline and joins the driver threads.
  void Shutdown();

 private:
  struct Entry {
    Pipeline                 pipeline;
    std::vector<std::string> owned_agents; // every worker spawned for this pipeline
    std::string              last_agent;
    bool                     cancelled = false;
    bool                     done      = false;
    std::thread              thread;
  };

  using EntryPtr = std::shared_ptr<Entry>;

  void Drive(const EntryPtr& entry);
  void RunPlanning(const EntryPtr& entry);
  void RunBuildAndVerify(const EntryPtr& entry);

  // Returns false when the pipeline should stop (step failed or pipeline cancelled).
  bool RunStep(const EntryPtr& entry, StepRole role, const std::string& prompt);

  // Applies a transition unless the pipeline was finalized concurrently. Returns false in that case.
  bool Advance(const EntryPtr& entry, PipelineState to, const std::string& reason);

  void Fail(const EntryPtr& entry, const std::string& reason);
  void Finalize(const EntryPtr& entry);
  void ReleaseAgents(const std::vector<std::string>& agent_ids);
  void ReapFinished();

  void EmitStepStatus(const std::string& pipeline_id, const PipelineStep& step);
  void EmitStepCompleted(const std::string& pipeline_id, const PipelineStep& step);
  void EmitCompleted(const Pipeline& pipeline);

  std::shared_ptr<StepExecutor>      executor_;
  std::shared_ptr<events::EventSink> events_;
  PipelineOptions                    options_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable done_cv_;
  std::map<std::string, EntryPtr> pipelines_;
  bool                            shutting_down_ = false;
};

} // namespace foreman::pipeline
