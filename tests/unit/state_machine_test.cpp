#include "internal/pipeline/state_machine.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using foreman::pipeline::CanTransition;
using foreman::pipeline::PipelineState;
using foreman::pipeline::StateMachine;

void TestHappyPathIsAccepted() {
  StateMachine machine;
  machine.Apply(PipelineState::kAnalyzingTask, "analyze");
  machine.Apply(PipelineState::kSelectingInstructions, "select");
  machine.Apply(PipelineState::kPlanning, "plan");
  machine.Apply(PipelineState::kPlanReady, "planned");
  machine.Apply(PipelineState::kReadyForExecution, "ready");
  machine.Apply(PipelineState::kExecuting, "build");
  machine.Apply(PipelineState::kVerifying, "verify");
  machine.Apply(PipelineState::kCompleted, "done");

  assert(machine.State() == PipelineState::kCompleted);
  assert(machine.Terminal());
  assert(machine.History().size() == 8);
  assert(machine.History().front().from == PipelineState::kReceivedTask);
  assert(machine.History().back().reason == "done");
}

void TestIllegalEdgeThrowsAndLeavesStateAlone() {
  StateMachine machine;
  bool         threw = false;
  try {
    machine.Apply(PipelineState::kExecuting, "skip ahead");
  } catch (const foreman::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(machine.State() == PipelineState::kReceivedTask);
  assert(machine.History().empty());
}

void TestTerminalStatesHaveNoExits() {
  StateMachine machine(PipelineState::kCompleted);
  bool         threw = false;
  try {
    machine.Apply(PipelineState::kPlanning, "again");
  } catch (const foreman::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  for (auto to = 1; to <= 15; ++to) {
    assert(!CanTransition(PipelineState::kFailed, static_cast<PipelineState>(to)));
    assert(!CanTransition(PipelineState::kGaveUp, static_cast<PipelineState>(to)));
  }
}

void TestOnlyPlanningMayLoopOnItself() {
  assert(CanTransition(PipelineState::kPlanning, PipelineState::kPlanning));
  assert(!CanTransition(PipelineState::kExecuting, PipelineState::kExecuting));
  assert(!CanTransition(PipelineState::kVerifying, PipelineState::kVerifying));
}

void TestVerificationEdges() {
  assert(CanTransition(PipelineState::kVerifying, PipelineState::kCompleted));
  assert(CanTransition(PipelineState::kVerifying, PipelineState::kReadyForExecution));
  assert(CanTransition(PipelineState::kVerifying, PipelineState::kPlanning));
  assert(CanTransition(PipelineState::kVerificationFailed, PipelineState::kGaveUp));
  assert(!CanTransition(PipelineState::kReadyForExecution, PipelineState::kFailed));
}

void TestNamesAndPhases() {
  assert(foreman::pipeline::StateName(PipelineState::kPlanRevisionRequired) == "PlanRevisionRequired");
  assert(foreman::pipeline::PhaseName(PipelineState::kGeneratingSkills) == "Skill Synthesis");
  assert(foreman::pipeline::PhaseName(PipelineState::kExecuting) == "Execution");
  assert(foreman::pipeline::PhaseName(PipelineState::kGaveUp) == "Terminal");
}

} // namespace

int main() {
  TestHappyPathIsAccepted();
  TestIllegalEdgeThrowsAndLeavesStateAlone();
  TestTerminalStatesHaveNoExits();
  TestOnlyPlanningMayLoopOnItself();
  TestVerificationEdges();
  TestNamesAndPhases();

  std::cout << "foreman_unit_state_machine: pass\n";
  return 0;
}
