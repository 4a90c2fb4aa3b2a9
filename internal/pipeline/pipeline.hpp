#pragma once

#include <google/protobuf/struct.pb.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "foreman/v1/pipeline.pb.h"
#include "state_machine.hpp"

namespace foreman::pipeline {

enum class StepRole : std::uint8_t {
  kPlanning  = 1,
  kBuilding  = 2,
  kVerifying = 3,
};

enum class StepStatus : std::uint8_t {
  kPending,
  kRunning,
  kCompleted,
  kFailed,
};

std::string_view RoleName(StepRole role);

struct StepOutput {
  std::string                            raw_text;
  std::optional<google::protobuf::Value> structured_data;
};

struct PipelineStep {
  uint32_t    step_number = 0;
  StepRole    role        = StepRole::kPlanning;
  std::string agent_id;
  StepStatus  status = StepStatus::kPending;
  StepOutput  output;
  int64_t     started_at_ms   = 0;
  int64_t     completed_at_ms = 0;

  void Reset();
};

enum class DecisionKind : std::uint8_t {
  kComplete,
  kIterate,
  kReplan,
  kGiveUp,
};

// "complete" | "iterate" | "replan" | "give_up"
std::string_view DecisionName(DecisionKind kind);

struct Decision {
  DecisionKind             kind = DecisionKind::kIterate;
  std::string              reasoning;
  std::vector<std::string> issues;
  std::vector<std::string> suggestions;
};

struct IterationRecord {
  uint32_t                 iteration = 0;
  std::string              decision;
  std::string              reasoning;
  std::vector<std::string> issues;
  std::vector<std::string> suggestions;
  int64_t                  timestamp_ms = 0;
};

/*
  One orchestrated task. Mutated only by the thread that drives it; readers
  get copies from PipelineManager.
*/
struct Pipeline {
  std::string                 id;
  std::string                 user_request;
  std::string                 working_dir;
  StateMachine                machine;
  std::array<PipelineStep, 3> steps;
  uint32_t                    current_iteration = 1;
  uint32_t                    max_iterations    = 0; // 0 = unbounded
  std::vector<IterationRecord> history;
  std::string                 status = "running"; // running | completed | failed
  std::string                 final_decision;
  std::string                 failure_reason;
  std::vector<std::string>    questions;
  std::array<StepOutput, 3>   previous_outputs; // step outputs before the last replan
  int64_t                     created_at_ms   = 0;
  int64_t                     completed_at_ms = 0;

  static Pipeline Create(std::string id, std::string user_request, std::string working_dir, uint32_t max_iterations);

  PipelineStep&       Step(StepRole role);
  const PipelineStep& Step(StepRole role) const;

  bool Bounded() const {
    return max_iterations > 0;
  }

  bool Finished() const {
    return status != "running";
  }

  // next iteration: build and verify run again
  void ResetForIteration();

  // next iteration: all three steps run again
  void ResetForReplan();

  // agent ids of every step that ran a worker
  std::vector<std::string> AgentIds() const;

  foreman::v1::Pipeline ToProto() const;
};

} // namespace foreman::pipeline
