#include "state_machine.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace foreman::pipeline {

std::string_view StateName(PipelineState state) {
  switch (state) {
    case PipelineState::kReceivedTask:
      return "ReceivedTask";
    case PipelineState::kAnalyzingTask:
      return "AnalyzingTask";
    case PipelineState::kSelectingInstructions:
      return "SelectingInstructions";
    case PipelineState::kGeneratingSkills:
      return "GeneratingSkills";
    case PipelineState::kPlanning:
      return "Planning";
    case PipelineState::kPlanReady:
      return "PlanReady";
    case PipelineState::kPlanRevisionRequired:
      return "PlanRevisionRequired";
    case PipelineState::kReadyForExecution:
      return "ReadyForExecution";
    case PipelineState::kExecuting:
      return "Executing";
    case PipelineState::kVerifying:
      return "Verifying";
    case PipelineState::kVerificationPassed:
      return "VerificationPassed";
    case PipelineState::kVerificationFailed:
      return "VerificationFailed";
    case PipelineState::kCompleted:
      return "Completed";
    case PipelineState::kFailed:
      return "Failed";
    case PipelineState::kGaveUp:
      return "GaveUp";
  }
  return "Unknown";
}

std::string_view PhaseName(PipelineState state) {
  switch (state) {
    case PipelineState::kReceivedTask:
    case PipelineState::kAnalyzingTask:
    case PipelineState::kSelectingInstructions:
    case PipelineState::kGeneratingSkills:
      return "Skill Synthesis";
    case PipelineState::kPlanning:
    case PipelineState::kPlanReady:
    case PipelineState::kPlanRevisionRequired:
      return "Planning";
    case PipelineState::kReadyForExecution:
    case PipelineState::kExecuting:
      return "Execution";
    case PipelineState::kVerifying:
    case PipelineState::kVerificationPassed:
    case PipelineState::kVerificationFailed:
      return "Verification";
    case PipelineState::kCompleted:
    case PipelineState::kFailed:
    case PipelineState::kGaveUp:
      return "Terminal";
  }
  return "Terminal";
}

foreman::v1::PipelineState ToProto(PipelineState state) {
  // enum values are kept in step with the wire enum
  return static_cast<foreman::v1::PipelineState>(static_cast<int>(state));
}

StateMachine::StateMachine(PipelineState initial) : state_(initial) {
}

void StateMachine::Apply(PipelineState to, std::string reason) {
  if (!CanTransition(state_, to)) {
    throw util::InvalidTransition(std::string(StateName(state_)), std::string(StateName(to)));
  }
  history_.push_back(StateTransition{state_, to, std::move(reason), util::NowMillis()});
  state_ = to;
}

} // namespace foreman::pipeline
