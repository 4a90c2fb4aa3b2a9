#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "foreman/v1/pipeline.pb.h"

namespace foreman::pipeline {

enum class PipelineState : std::uint8_t {
  kReceivedTask          = 1,
  kAnalyzingTask         = 2,
  kSelectingInstructions = 3,
  kGeneratingSkills      = 4,
  kPlanning              = 5,
  kPlanReady             = 6,
  kPlanRevisionRequired  = 7,
  kReadyForExecution     = 8,
  kExecuting             = 9,
  kVerifying             = 10,
  kVerificationPassed    = 11,
  kVerificationFailed    = 12,
  kCompleted             = 13,
  kFailed                = 14,
  kGaveUp                = 15,
};

constexpr bool IsTerminal(PipelineState state) {
  return state == PipelineState::kCompleted || state == PipelineState::kFailed || state == PipelineState::kGaveUp;
}

/*
  The complete edge table. Anything not listed is illegal, including
  self-loops other than Planning -> Planning and every edge out of a
  terminal state.
*/
constexpr bool CanTransition(PipelineState from, PipelineState to) {
  using S = PipelineState;
  switch (from) {
    case S::kReceivedTask:
      return to == S::kAnalyzingTask || to == S::kPlanning;
    case S::kAnalyzingTask:
      return to == S::kSelectingInstructions || to == S::kFailed;
    case S::kSelectingInstructions:
      return to == S::kGeneratingSkills || to == S::kPlanning || to == S::kFailed;
    case S::kGeneratingSkills:
      return to == S::kPlanning || to == S::kFailed;
    case S::kPlanning:
      return to == S::kPlanReady || to == S::kPlanning || to == S::kFailed;
    case S::kPlanReady:
      return to == S::kReadyForExecution || to == S::kPlanRevisionRequired || to == S::kPlanning;
    case S::kPlanRevisionRequired:
      return to == S::kPlanning;
    case S::kReadyForExecution:
      return to == S::kExecuting;
    case S::kExecuting:
      return to == S::kVerifying || to == S::kFailed;
    case S::kVerifying:
      return to == S::kCompleted || to == S::kPlanning || to == S::kReadyForExecution || to == S::kVerificationPassed ||
             to == S::kVerificationFailed || to == S::kFailed;
    case S::kVerificationPassed:
      return to == S::kCompleted;
    case S::kVerificationFailed:
      return to == S::kPlanning || to == S::kExecuting || to == S::kGaveUp;
    case S::kCompleted:
    case S::kFailed:
    case S::kGaveUp:
      return false;
  }
  return false;
}

std::string_view StateName(PipelineState state);

// "Skill Synthesis", "Planning", "Execution", "Verification" or "Terminal"
std::string_view PhaseName(PipelineState state);

foreman::v1::PipelineState ToProto(PipelineState state);

struct StateTransition {
  PipelineState from;
  PipelineState to;
  std::string   reason;
  int64_t       timestamp_ms = 0;
};

/*
  Current state plus the audit trail of applied transitions.

  Apply validates against CanTransition and throws util::InvalidTransition
  for an illegal edge; the state and history are unchanged in that case.
*/
class StateMachine {
 public:
  explicit StateMachine(PipelineState initial = PipelineState::kReceivedTask);

  void Apply(PipelineState to, std::string reason);

  PipelineState State() const {
    return state_;
  }

  bool Terminal() const {
    return IsTerminal(state_);
  }

  const std::vector<StateTransition>& History() const {
    return history_;
  }

 private:
  PipelineState                state_;
  std::vector<StateTransition> history_;
};

} // namespace foreman::pipeline
