#include "decision.hpp"

#include <google/protobuf/struct.pb.h>

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace foreman::pipeline {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::vector<std::string> StringList(const google::protobuf::Struct& object, std::string_view key) {
  std::vector<std::string> out;
  const auto* list = util::GetList(object, key);
  if (!list) {
    if (auto single = util::GetString(object, key); single && !single->empty()) {
      out.push_back(*single);
    }
    return out;
  }
  for (const auto& item : list->values()) {
    if (item.has_string_value()) {
      out.push_back(item.string_value());
    } else if (item.has_struct_value()) {
      // {"description": ...} or {"issue": ...} style entries
      const auto& entry = item.struct_value();
      for (const char* field : {"description", "issue", "message", "summary"}) {
        if (auto text = util::GetString(entry, field)) {
          out.push_back(*text);
          break;
        }
      }
    }
  }
  return out;
}

std::optional<DecisionKind> KindFromName(const std::string& name) {
  const auto lowered = Lower(name);
  if (lowered == "complete" || lowered == "completed") return DecisionKind::kComplete;
  if (lowered == "iterate") return DecisionKind::kIterate;
  if (lowered == "replan") return DecisionKind::kReplan;
  if (lowered == "give_up" || lowered == "giveup") return DecisionKind::kGiveUp;
  return std::nullopt;
}

std::optional<DecisionKind> KindFromStatus(const std::string& status) {
  const auto lowered = Lower(status);
  if (lowered == "success") return DecisionKind::kComplete;
  if (lowered == "partial") return DecisionKind::kIterate;
  if (lowered == "failed") return DecisionKind::kReplan;
  return std::nullopt;
}

void Finish(Pipeline& pipeline, std::string status) {
  pipeline.status          = std::move(status);
  pipeline.completed_at_ms = util::NowMillis();
}

} // namespace

Decision ParseDecision(std::string_view verification_output) {
  Decision decision;
  auto     object = util::ParseObject(util::ExtractJsonText(verification_output));
  if (!object) {
    decision.kind      = DecisionKind::kIterate;
    decision.reasoning = "verification output could not be interpreted";
    decision.issues.push_back("verification output was not valid JSON");
    return decision;
  }

  std::optional<DecisionKind> kind;
  if (auto name = util::GetString(*object, "decision")) {
    kind = KindFromName(*name);
  }
  if (!kind) {
    if (auto status = util::GetString(*object, "overall_status")) {
      kind = KindFromStatus(*status);
    }
  }
  decision.kind = kind.value_or(DecisionKind::kIterate);

  if (auto reasoning = util::GetString(*object, "reasoning")) {
    decision.reasoning = *reasoning;
  } else if (auto summary = util::GetString(*object, "summary")) {
    decision.reasoning = *summary;
  }

  decision.issues = StringList(*object, "issues_to_fix");
  if (decision.issues.empty()) {
    decision.issues = StringList(*object, "issues_found");
  }
  decision.suggestions = StringList(*object, "suggestions");
  if (decision.suggestions.empty()) {
    decision.suggestions = StringList(*object, "recommendations");
  }
  return decision;
}

void ApplyDecision(Pipeline& pipeline, const Decision& decision) {
  if (pipeline.machine.State() != PipelineState::kVerifying) {
    throw util::InvalidTransition(std::string(StateName(pipeline.machine.State())), "decision");
  }

  const std::string name(DecisionName(decision.kind));
  pipeline.history.push_back(IterationRecord{pipeline.current_iteration, name, decision.reasoning, decision.issues, decision.suggestions,
                                             util::NowMillis()});
  pipeline.final_decision = name;

  switch (decision.kind) {
    case DecisionKind::kComplete:
      pipeline.machine.Apply(PipelineState::kCompleted, decision.reasoning);
      Finish(pipeline, "completed");
      return;

    case DecisionKind::kGiveUp:
      pipeline.machine.Apply(PipelineState::kVerificationFailed, decision.reasoning);
      pipeline.machine.Apply(PipelineState::kGaveUp, decision.reasoning);
      pipeline.failure_reason = decision.reasoning.empty() ? "gave up" : decision.reasoning;
      Finish(pipeline, "failed");
      return;

    case DecisionKind::kIterate:
    case DecisionKind::kReplan:
      break;
  }

  if (pipeline.Bounded() && pipeline.current_iteration + 1 > pipeline.max_iterations) {
    pipeline.machine.Apply(PipelineState::kFailed, std::string(kMaxIterationsReason));
    pipeline.failure_reason = std::string(kMaxIterationsReason);
    Finish(pipeline, "failed");
    return;
  }

  if (decision.kind == DecisionKind::kIterate) {
    pipeline.machine.Apply(PipelineState::kReadyForExecution, "iterate");
    pipeline.ResetForIteration();
  } else {
    pipeline.machine.Apply(PipelineState::kPlanning, "replan");
    pipeline.ResetForReplan();
  }
}

void MarkFailed(Pipeline& pipeline, const std::string& reason) {
  if (pipeline.machine.Terminal()) {
    return;
  }
  switch (pipeline.machine.State()) {
    case PipelineState::kReceivedTask:
    case PipelineState::kPlanReady:
    case PipelineState::kPlanRevisionRequired:
    case PipelineState::kVerificationFailed:
      pipeline.machine.Apply(PipelineState::kPlanning, reason);
      break;
    case PipelineState::kReadyForExecution:
      pipeline.machine.Apply(PipelineState::kExecuting, reason);
      break;
    default:
      break;
  }
  pipeline.machine.Apply(PipelineState::kFailed, reason);
  pipeline.failure_reason = reason;
  Finish(pipeline, "failed");
}

} // namespace foreman::pipeline
