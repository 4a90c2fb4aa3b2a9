#include "internal/pipeline/decision.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using foreman::pipeline::Decision;
using foreman::pipeline::DecisionKind;
using foreman::pipeline::Pipeline;
using foreman::pipeline::PipelineState;
using foreman::pipeline::StepRole;
using foreman::pipeline::StepStatus;

Pipeline VerifyingPipeline(uint32_t max_iterations) {
  auto pipeline = Pipeline::Create("pipe-1", "add a readme", "/tmp", max_iterations);
  pipeline.machine.Apply(PipelineState::kPlanning, "plan");
  pipeline.machine.Apply(PipelineState::kPlanReady, "planned");
  pipeline.machine.Apply(PipelineState::kReadyForExecution, "ready");
  pipeline.machine.Apply(PipelineState::kExecuting, "build");
  pipeline.machine.Apply(PipelineState::kVerifying, "verify");
  for (auto role : {StepRole::kPlanning, StepRole::kBuilding, StepRole::kVerifying}) {
    auto& step           = pipeline.Step(role);
    step.status          = StepStatus::kCompleted;
    step.agent_id        = "agent-" + std::to_string(step.step_number);
    step.output.raw_text = "output " + std::to_string(step.step_number);
  }
  return pipeline;
}

Decision Make(DecisionKind kind, std::string reasoning) {
  Decision decision;
  decision.kind      = kind;
  decision.reasoning = std::move(reasoning);
  return decision;
}

void TestExplicitDecisionWins() {
  const auto decision = foreman::pipeline::ParseDecision(
      R"({"overall_status":"success","decision":"REPLAN","reasoning":"wrong approach","issues_to_fix":["a","b"],"suggestions":["c"]})");
  assert(decision.kind == DecisionKind::kReplan);
  assert(decision.reasoning == "wrong approach");
  assert(decision.issues.size() == 2);
  assert(decision.suggestions.size() == 1);
}

void TestOverallStatusFallback() {
  assert(foreman::pipeline::ParseDecision(R"({"overall_status":"success"})").kind == DecisionKind::kComplete);
  assert(foreman::pipeline::ParseDecision(R"({"overall_status":"partial"})").kind == DecisionKind::kIterate);
  assert(foreman::pipeline::ParseDecision(R"({"overall_status":"failed"})").kind == DecisionKind::kReplan);
  assert(foreman::pipeline::ParseDecision(R"({"decision":"giveup"})").kind == DecisionKind::kGiveUp);
  assert(foreman::pipeline::ParseDecision(R"({"decision":"maybe"})").kind == DecisionKind::kIterate);
}

void TestFencedJsonAndAlternateKeys() {
  const auto decision = foreman::pipeline::ParseDecision(
      "Checked everything.\n```json\n{\"overall_status\":\"partial\",\"summary\":\"tests missing\","
      "\"issues_found\":[{\"description\":\"no tests\"}],\"recommendations\":[\"add tests\"]}\n```\n");
  assert(decision.kind == DecisionKind::kIterate);
  assert(decision.reasoning == "tests missing");
  assert(decision.issues.size() == 1 && decision.issues[0] == "no tests");
  assert(decision.suggestions.size() == 1 && decision.suggestions[0] == "add tests");
}

void TestUnparseableOutputIterates() {
  const auto decision = foreman::pipeline::ParseDecision("looks fine to me");
  assert(decision.kind == DecisionKind::kIterate);
  assert(decision.issues.size() == 1);
}

void TestCompleteFinishesPipeline() {
  auto pipeline = VerifyingPipeline(3);
  foreman::pipeline::ApplyDecision(pipeline, Make(DecisionKind::kComplete, "all good"));

  assert(pipeline.machine.State() == PipelineState::kCompleted);
  assert(pipeline.status == "completed");
  assert(pipeline.final_decision == "complete");
  assert(pipeline.history.size() == 1);
  assert(pipeline.history[0].iteration == 1);
  assert(pipeline.completed_at_ms > 0);
}

void TestGiveUpPassesThroughVerificationFailed() {
  auto pipeline = VerifyingPipeline(3);
  foreman::pipeline::ApplyDecision(pipeline, Make(DecisionKind::kGiveUp, "impossible"));

  assert(pipeline.machine.State() == PipelineState::kGaveUp);
  const auto& history = pipeline.machine.History();
  assert(history[history.size() - 2].to == PipelineState::kVerificationFailed);
  assert(pipeline.status == "failed");
  assert(pipeline.failure_reason == "impossible");
  assert(pipeline.final_decision == "give_up");
}

void TestIterateResetsBuildAndVerify() {
  auto pipeline = VerifyingPipeline(3);
  foreman::pipeline::ApplyDecision(pipeline, Make(DecisionKind::kIterate, "fix lint"));

  assert(pipeline.machine.State() == PipelineState::kReadyForExecution);
  assert(pipeline.current_iteration == 2);
  assert(pipeline.Step(StepRole::kPlanning).status == StepStatus::kCompleted);
  assert(pipeline.Step(StepRole::kBuilding).status == StepStatus::kPending);
  assert(pipeline.Step(StepRole::kBuilding).agent_id.empty());
  assert(pipeline.Step(StepRole::kVerifying).status == StepStatus::kPending);
  assert(pipeline.status == "running");
}

void TestReplanResetsEveryStepAndKeepsOutputs() {
  auto pipeline = VerifyingPipeline(0);
  foreman::pipeline::ApplyDecision(pipeline, Make(DecisionKind::kReplan, "start over"));

  assert(pipeline.machine.State() == PipelineState::kPlanning);
  assert(pipeline.current_iteration == 2);
  assert(pipeline.Step(StepRole::kPlanning).status == StepStatus::kPending);
  assert(pipeline.previous_outputs[0].raw_text == "output 1");
  assert(pipeline.previous_outputs[2].raw_text == "output 3");
}

void TestIterationLimitFailsPipeline() {
  auto pipeline              = VerifyingPipeline(2);
  pipeline.current_iteration = 2;
  foreman::pipeline::ApplyDecision(pipeline, Make(DecisionKind::kIterate, "still broken"));

  assert(pipeline.machine.State() == PipelineState::kFailed);
  assert(pipeline.status == "failed");
  assert(pipeline.failure_reason == std::string(foreman::pipeline::kMaxIterationsReason));
  assert(pipeline.history.size() == 1);
  assert(pipeline.final_decision == "iterate");
}

void TestDecisionOutsideVerifyingThrows() {
  auto pipeline = Pipeline::Create("pipe-2", "x", "/tmp", 3);
  bool threw    = false;
  try {
    foreman::pipeline::ApplyDecision(pipeline, Make(DecisionKind::kComplete, ""));
  } catch (const foreman::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(pipeline.history.empty());
}

void TestMarkFailedFromEveryWorkingState() {
  auto received = Pipeline::Create("pipe-3", "x", "/tmp", 3);
  foreman::pipeline::MarkFailed(received, "cancelled");
  assert(received.machine.State() == PipelineState::kFailed);
  assert(received.failure_reason == "cancelled");

  auto ready = VerifyingPipeline(3);
  foreman::pipeline::ApplyDecision(ready, Make(DecisionKind::kIterate, "again"));
  foreman::pipeline::MarkFailed(ready, "cancelled");
  assert(ready.machine.State() == PipelineState::kFailed);

  auto done = VerifyingPipeline(3);
  foreman::pipeline::ApplyDecision(done, Make(DecisionKind::kComplete, "ok"));
  foreman::pipeline::MarkFailed(done, "cancelled");
  assert(done.machine.State() == PipelineState::kCompleted);
  assert(done.status == "completed");
}

} // namespace

int main() {
  TestExplicitDecisionWins();
  TestOverallStatusFallback();
  TestFencedJsonAndAlternateKeys();
  TestUnparseableOutputIterates();
  TestCompleteFinishesPipeline();
  TestGiveUpPassesThroughVerificationFailed();
  TestIterateResetsBuildAndVerify();
  TestReplanResetsEveryStepAndKeepsOutputs();
  TestIterationLimitFailsPipeline();
  TestDecisionOutsideVerifyingThrows();
  TestMarkFailedFromEveryWorkingState();

  std::cout << "foreman_unit_decision: pass\n";
  return 0;
}
