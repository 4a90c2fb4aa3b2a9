#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "internal/supervisor/agent_supervisor.hpp"
#include "pipeline.hpp"

namespace foreman::pipeline {

struct StepRequest {
  std::string pipeline_id;
  std::string working_dir;
  StepRole    role = StepRole::kPlanning;
  std::string prompt;
  std::string previous_agent_id; // worker of the step that ran before, stopped first
};

struct StepResult {
  bool        ok = false;
  std::string agent_id;
  StepOutput  output;
  std::string error;
};

/*
  Runs one pipeline step to completion. Blocking; called from the thread
  that drives the pipeline.
*/
class StepExecutor {
 public:
  using SpawnedCallback = std::function<void(const std::string& agent_id)>;

  virtual ~StepExecutor() = default;

  // `on_spawned` runs as soon as the step's worker exists, before its turn completes.
  virtual StepResult Run(const StepRequest& request, const SpawnedCallback& on_spawned) = 0;

  // Stops a worker started by Run. Unknown or finished workers are ignored.
  virtual void Release(const std::string& agent_id) = 0;
};

// Runs each step as one turn of a fresh worker process.
class AgentStepExecutor final : public StepExecutor {
 public:
  AgentStepExecutor(std::shared_ptr<supervisor::AgentSupervisor> supervisor, std::chrono::milliseconds step_timeout);

  StepResult Run(const StepRequest& request, const SpawnedCallback& on_spawned) override;
  void       Release(const std::string& agent_id) override;

  // Last "result" event content, else the last "text" event; fenced JSON is parsed into structured data.
  static StepOutput ExtractOutput(const std::vector<foreman::v1::OutputEvent>& events);

 private:
  std::shared_ptr<supervisor::AgentSupervisor> supervisor_;
  std::chrono::milliseconds                    step_timeout_;
};

} // namespace foreman::pipeline
