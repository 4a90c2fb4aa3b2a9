#include "prompts.hpp"

#include <sstream>

#include "internal/util/json.hpp"

namespace foreman::pipeline {

namespace {

std::string OutputText(const StepOutput& output) {
  if (output.raw_text.empty()) {
    return "(no output)";
  }
  return output.raw_text;
}

std::string StepText(const PipelineStep& step) {
  return OutputText(step.output);
}

void AppendList(std::ostringstream& out, const std::string& title, const std::vector<std::string>& items) {
  if (items.empty()) {
    return;
  }
  out << title << ":\n";
  for (const auto& item : items) {
    out << "- " << item << "\n";
  }
  out << "\n";
}

const IterationRecord* LastRecord(const Pipeline& pipeline) {
  return pipeline.history.empty() ? nullptr : &pipeline.history.back();
}

constexpr const char* kPlanFormat = R"(Respond with one JSON object and nothing else:
{
  "plan": ["step 1", "step 2"],
  "questions": ["anything that is ambiguous about the request"]
}
)";

} // namespace

std::string PlanningPrompt(const Pipeline& pipeline) {
  std::ostringstream out;
  out << "You are the planning agent of a plan / build / verify pipeline.\n\n"
      << "Task:\n"
      << pipeline.user_request << "\n\n"
      << "Working directory: " << pipeline.working_dir << "\n\n"
      << "Study the code base and write a concrete implementation plan. Do not modify any files.\n"
      << "List open questions only when the answer changes the plan.\n\n"
      << kPlanFormat;
  return out.str();
}

std::string BuildingPrompt(const Pipeline& pipeline) {
  std::ostringstream out;
  out << "You are the implementation agent of a plan / build / verify pipeline.\n\n"
      << "Task:\n"
      << pipeline.user_request << "\n\n"
      << "Working directory: " << pipeline.working_dir << "\n\n"
      << "Plan:\n"
      << StepText(pipeline.Step(StepRole::kPlanning)) << "\n\n";

  if (!pipeline.questions.empty()) {
    AppendList(out, "Open questions from planning (answer each with a reasonable default and note the choice)", pipeline.questions);
  }

  if (const auto* last = LastRecord(pipeline)) {
    out << "This is iteration " << pipeline.current_iteration << ". The previous verification asked for another pass.\n";
    if (!last->reasoning.empty()) {
      out << "Reason: " << last->reasoning << "\n";
    }
    out << "\n";
    AppendList(out, "Issues to fix", last->issues);
    AppendList(out, "Suggestions", last->suggestions);
  }

  out << "Implement the plan. When you are done, finish with a short summary that starts with\n"
      << "IMPLEMENTATION COMPLETE and lists the files you changed and anything left undone.\n";
  return out.str();
}

std::string VerificationPrompt(const Pipeline& pipeline) {
  std::ostringstream out;
  out << "You are the verification agent of a plan / build / verify pipeline.\n\n"
      << "Task:\n"
      << pipeline.user_request << "\n\n"
      << "Working directory: " << pipeline.working_dir << "\n\n"
      << "Plan:\n"
      << StepText(pipeline.Step(StepRole::kPlanning)) << "\n\n"
      << "Implementation report:\n"
      << StepText(pipeline.Step(StepRole::kBuilding)) << "\n\n"
      << "Check the work against the task and the plan. Run the tests if the project has any.\n"
      << "Do not fix anything yourself.\n\n"
      << "Then decide how the pipeline continues:\n"
      << "- complete: the task is done\n"
      << "- iterate: the plan is right but the implementation needs fixes\n"
      << "- replan: the plan itself is wrong\n"
      << "- give_up: the task cannot be done\n\n"
      << R"(Respond with one JSON object and nothing else:
{
  "overall_status": "success | partial | failed",
  "issues_found": ["..."],
  "recommendations": ["..."],
  "summary": "...",
  "decision": "complete | iterate | replan | give_up",
  "reasoning": "...",
  "issues_to_fix": ["..."],
  "suggestions": ["..."]
}
)";
  return out.str();
}

std::string ReplanPrompt(const Pipeline& pipeline) {
  std::ostringstream out;
  out << "You are the planning agent of a plan / build / verify pipeline. The previous plan did not work.\n\n"
      << "Task:\n"
      << pipeline.user_request << "\n\n"
      << "Working directory: " << pipeline.working_dir << "\n\n"
      << "Previous plan:\n"
      << OutputText(pipeline.previous_outputs[0]) << "\n\n"
      << "Previous implementation report:\n"
      << OutputText(pipeline.previous_outputs[1]) << "\n\n"
      << "Previous verification result:\n"
      << OutputText(pipeline.previous_outputs[2]) << "\n\n";

  if (const auto* last = LastRecord(pipeline)) {
    if (!last->reasoning.empty()) {
      out << "Why a new plan is needed: " << last->reasoning << "\n\n";
    }
    AppendList(out, "Issues", last->issues);
    AppendList(out, "Suggestions", last->suggestions);
  }

  out << "Write a revised plan that addresses these problems. Do not modify any files.\n\n" << kPlanFormat;
  return out.str();
}

std::vector<std::string> ExtractQuestions(const StepOutput& planning_output) {
  std::vector<std::string> questions;
  if (!planning_output.structured_data || !planning_output.structured_data->has_struct_value()) {
    return questions;
  }
  const auto* list = util::GetList(planning_output.structured_data->struct_value(), "questions");
  if (!list) {
    return questions;
  }
  for (const auto& item : list->values()) {
    if (item.has_string_value() && !item.string_value().empty()) {
      questions.push_back(item.string_value());
    }
  }
  return questions;
}

} // namespace foreman::pipeline
