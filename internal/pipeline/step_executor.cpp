#include "step_executor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace foreman::pipeline {

namespace {

using foreman::v1::AgentStatus;

std::string StatusLabel(AgentStatus status) {
  switch (status) {
    case foreman::v1::AGENT_STATUS_STOPPED:
      return "worker stopped before finishing the step";
    case foreman::v1::AGENT_STATUS_ERROR:
      return "worker process terminated unexpectedly";
    default:
      return "step timed out";
  }
}

} // namespace

AgentStepExecutor::AgentStepExecutor(std::shared_ptr<supervisor::AgentSupervisor> supervisor, std::chrono::milliseconds step_timeout)
    : supervisor_(std::move(supervisor)), step_timeout_(step_timeout) {
}

StepResult AgentStepExecutor::Run(const StepRequest& request, const SpawnedCallback& on_spawned) {
  StepResult result;

  if (!request.previous_agent_id.empty()) {
    Release(request.previous_agent_id);
  }

  supervisor::SpawnOptions options;
  options.working_dir = request.working_dir;
  options.source      = "pipeline";
  options.pipeline_id = request.pipeline_id;

  try {
    result.agent_id = supervisor_->Spawn(options);
  } catch (const util::SpawnError& e) {
    result.error = e.what();
    return result;
  }

  if (on_spawned) {
    on_spawned(result.agent_id);
  }

  try {
    supervisor_->SendInput(result.agent_id, request.prompt);
  } catch (const util::InvalidState& e) {
    result.error = e.what();
    return result;
  }

  const auto status = supervisor_->WaitForIdle(result.agent_id, step_timeout_);
  if (status != foreman::v1::AGENT_STATUS_WAITING_FOR_INPUT) {
    const bool turn_failed = status == foreman::v1::AGENT_STATUS_PROCESSING && supervisor_->LastTurnFailed(result.agent_id);
    result.error           = turn_failed ? "worker reported a failed turn" : StatusLabel(status);
    FOREMAN_LOG_WARN("Pipeline step did not finish", {observability::StringField("pipeline_id", request.pipeline_id),
                                                      observability::StringField("agent_id", result.agent_id),
                                                      observability::StringField("role", std::string(RoleName(request.role))),
                                                      observability::StringField("reason", result.error)});
    return result;
  }

  result.output = ExtractOutput(supervisor_->GetOutputs(result.agent_id));
  result.ok     = true;
  return result;
}

void AgentStepExecutor::Release(const std::string& agent_id) {
  try {
    supervisor_->Stop(agent_id);
  } catch (const util::NotFound&) {
    // aged out of the retired list
  }
}

StepOutput AgentStepExecutor::ExtractOutput(const std::vector<foreman::v1::OutputEvent>& events) {
  StepOutput                      output;
  const foreman::v1::OutputEvent* last_result = nullptr;
  const foreman::v1::OutputEvent* last_text   = nullptr;
  for (const auto& event : events) {
    if (event.output_type() == "result") {
      last_result = &event;
    } else if (event.output_type() == "text") {
      last_text = &event;
    }
  }

  // a result without a "result" string only carries a generated summary line
  if (last_result && last_result->parsed_json().has_struct_value()) {
    if (auto text = util::GetString(last_result->parsed_json().struct_value(), "result"); text && !text->empty()) {
      output.raw_text = *text;
    }
  }
  if (output.raw_text.empty() && last_text) {
    output.raw_text = last_text->content();
  }
  if (output.raw_text.empty() && last_result) {
    output.raw_text = last_result->content();
  }

  if (!output.raw_text.empty()) {
    output.structured_data = util::ParseValue(util::ExtractJsonText(output.raw_text));
  }
  return output;
}

} // namespace foreman::pipeline
