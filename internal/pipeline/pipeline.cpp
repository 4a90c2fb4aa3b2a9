#include "pipeline.hpp"

namespace foreman::pipeline {

static foreman::v1::StepStatus ToProto(StepStatus status) {
  switch (status) {
    case StepStatus::kPending:
      return foreman::v1::STEP_STATUS_PENDING;
    case StepStatus::kRunning:
      return foreman::v1::STEP_STATUS_RUNNING;
    case StepStatus::kCompleted:
      return foreman::v1::STEP_STATUS_COMPLETED;
    case StepStatus::kFailed:
      return foreman::v1::STEP_STATUS_FAILED;
  }
  return foreman::v1::STEP_STATUS_UNSPECIFIED;
}

std::string_view RoleName(StepRole role) {
  switch (role) {
    case StepRole::kPlanning:
      return "planning";
    case StepRole::kBuilding:
      return "building";
    case StepRole::kVerifying:
      return "verifying";
  }
  return "unknown";
}

std::string_view DecisionName(DecisionKind kind) {
  switch (kind) {
    case DecisionKind::kComplete:
      return "complete";
    case DecisionKind::kIterate:
      return "iterate";
    case DecisionKind::kReplan:
      return "replan";
    case DecisionKind::kGiveUp:
      return "give_up";
  }
  return "iterate";
}

void PipelineStep::Reset() {
  agent_id.clear();
  status          = StepStatus::kPending;
  output          = StepOutput{};
  started_at_ms   = 0;
  completed_at_ms = 0;
}

Pipeline Pipeline::Create(std::string id, std::string user_request, std::string working_dir, uint32_t max_iterations) {
  Pipeline pipeline;
  pipeline.id             = std::move(id);
  pipeline.user_request   = std::move(user_request);
  pipeline.working_dir    = std::move(working_dir);
  pipeline.max_iterations = max_iterations;
  for (const auto role : {StepRole::kPlanning, StepRole::kBuilding, StepRole::kVerifying}) {
    auto& step       = pipeline.Step(role);
    step.step_number = static_cast<uint32_t>(role);
    step.role        = role;
  }
  return pipeline;
}

PipelineStep& Pipeline::Step(StepRole role) {
  return steps[static_cast<size_t>(role) - 1];
}

const PipelineStep& Pipeline::Step(StepRole role) const {
  return steps[static_cast<size_t>(role) - 1];
}

void Pipeline::ResetForIteration() {
  ++current_iteration;
  Step(StepRole::kBuilding).Reset();
  Step(StepRole::kVerifying).Reset();
}

void Pipeline::ResetForReplan() {
  ++current_iteration;
  for (size_t i = 0; i < steps.size(); ++i) {
    previous_outputs[i] = steps[i].output;
    steps[i].Reset();
  }
  questions.clear();
}

std::vector<std::string> Pipeline::AgentIds() const {
  std::vector<std::string> ids;
  for (const auto& step : steps) {
    if (!step.agent_id.empty()) {
      ids.push_back(step.agent_id);
    }
  }
  return ids;
}

foreman::v1::Pipeline Pipeline::ToProto() const {
  foreman::v1::Pipeline out;
  out.set_id(id);
  out.set_user_request(user_request);
  out.set_working_dir(working_dir);
  out.set_state(pipeline::ToProto(machine.State()));
  out.set_phase(std::string(PhaseName(machine.State())));

  for (const auto& step : steps) {
    auto* s = out.add_steps();
    s->set_step_number(step.step_number);
    s->set_role(std::string(RoleName(step.role)));
    s->set_agent_id(step.agent_id);
    s->set_status(pipeline::ToProto(step.status));
    s->mutable_output()->set_raw_text(step.output.raw_text);
    if (step.output.structured_data) {
      *s->mutable_output()->mutable_structured_data() = *step.output.structured_data;
    }
    s->set_started_at_ms(step.started_at_ms);
    s->set_completed_at_ms(step.completed_at_ms);
  }

  out.set_current_iteration(current_iteration);
  out.set_max_iterations(max_iterations);
  for (const auto& record : history) {
    auto* r = out.add_iteration_history();
    r->set_iteration(record.iteration);
    r->set_decision(record.decision);
    r->set_reasoning(record.reasoning);
    for (const auto& issue : record.issues) {
      r->add_issues(issue);
    }
    for (const auto& suggestion : record.suggestions) {
      r->add_suggestions(suggestion);
    }
    r->set_timestamp_ms(record.timestamp_ms);
  }

  out.set_status(status);
  out.set_final_decision(final_decision);
  out.set_failure_reason(failure_reason);
  for (const auto& question : questions) {
    out.add_questions(question);
  }
  for (const auto& transition : machine.History()) {
    auto* t = out.add_transitions();
    t->set_from(pipeline::ToProto(transition.from));
    t->set_to(pipeline::ToProto(transition.to));
    t->set_reason(transition.reason);
    t->set_timestamp_ms(transition.timestamp_ms);
  }
  out.set_created_at_ms(created_at_ms);
  out.set_completed_at_ms(completed_at_ms);
  return out;
}

} // namespace foreman::pipeline
