#include "pipeline_manager.hpp"

#include "decision.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "prompts.hpp"

namespace foreman::pipeline {

namespace {

using google::protobuf::Struct;

std::string_view StepStatusName(StepStatus status) {
  switch (status) {
    case StepStatus::kPending:
      return "pending";
    case StepStatus::kRunning:
      return "running";
    case StepStatus::kCompleted:
      return "completed";
    case StepStatus::kFailed:
      return "failed";
  }
  return "pending";
}

google::protobuf::Value StringList(const std::vector<std::string>& items) {
  google::protobuf::Value value;
  auto*                   list = value.mutable_list_value();
  for (const auto& item : items) {
    *list->add_values() = util::StringValue(item);
  }
  return value;
}

} // namespace

PipelineManager::PipelineManager(std::shared_ptr<StepExecutor> executor, std::shared_ptr<events::EventSink> events, PipelineOptions options)
    : executor_(std::move(executor)), events_(std::move(events)), options_(options) {
}

PipelineManager::~PipelineManager() {
  Shutdown();
}

std::string PipelineManager::Submit(std::string user_request, std::string working_dir, uint32_t max_iterations) {
  ReapFinished();

  auto entry      = std::make_shared<Entry>();
  entry->pipeline = Pipeline::Create(util::NewId(), std::move(user_request), std::move(working_dir),
                                     max_iterations > 0 ? max_iterations : options_.default_max_iterations);
  entry->pipeline.created_at_ms = util::NowMillis();
  const auto id                 = entry->pipeline.id;
  const auto dir                = entry->pipeline.working_dir;
  const auto limit              = entry->pipeline.max_iterations;

  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      throw util::InvalidState("Pipeline manager is shutting down");
    }
    pipelines_.emplace(id, entry);
    entry->thread = std::thread([this, entry] { Drive(entry); });
  }

  FOREMAN_LOG_INFO("Pipeline submitted", {observability::StringField("pipeline_id", id),
                                          observability::StringField("working_dir", dir),
                                          observability::IntField("max_iterations", limit)});
  return id;
}

std::optional<Pipeline> PipelineManager::Get(const std::string& pipeline_id) const {
  std::lock_guard lock(mutex_);
  auto            it = pipelines_.find(pipeline_id);
  if (it == pipelines_.end()) {
    return std::nullopt;
  }
  return it->second->pipeline;
}

std::vector<Pipeline> PipelineManager::List() const {
  std::lock_guard       lock(mutex_);
  std::vector<Pipeline> out;
  out.reserve(pipelines_.size());
  for (const auto& [id, entry] : pipelines_) {
    out.push_back(entry->pipeline);
  }
  return out;
}

void PipelineManager::Cancel(const std::string& pipeline_id) {
  std::vector<std::string> agents;
  Pipeline                 snapshot;
  {
    std::lock_guard lock(mutex_);
    auto            it = pipelines_.find(pipeline_id);
    if (it == pipelines_.end()) {
      throw util::NotFound("Pipeline not found: " + pipeline_id);
    }
    auto& entry = *it->second;
    if (entry.pipeline.Finished()) {
      throw util::InvalidState("Pipeline already finished: " + pipeline_id);
    }
    entry.cancelled = true;
    MarkFailed(entry.pipeline, "cancelled");
    agents   = entry.owned_agents;
    snapshot = entry.pipeline;
  }

  FOREMAN_LOG_INFO("Pipeline cancelled", {observability::StringField("pipeline_id", pipeline_id)});
  ReleaseAgents(agents);
  EmitCompleted(snapshot);
}

bool PipelineManager::WaitForCompletion(const std::string& pipeline_id, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  auto             it = pipelines_.find(pipeline_id);
  if (it == pipelines_.end()) {
    throw util::NotFound("Pipeline not found: " + pipeline_id);
  }
  auto entry = it->second;
  auto done  = [&] { return entry->done; };
  if (timeout.count() > 0) {
    return done_cv_.wait_for(lock, timeout, done);
  }
  done_cv_.wait(lock, done);
  return true;
}

void PipelineManager::Shutdown() {
  std::vector<std::string> running;
  {
    std::lock_guard lock(mutex_);
    shutting_down_ = true;
    for (const auto& [id, entry] : pipelines_) {
      if (!entry->pipeline.Finished()) {
        running.push_back(id);
      }
    }
  }

  for (const auto& id : running) {
    try {
      Cancel(id);
    } catch (const util::InvalidState&) {
      // finished on its own in the meantime
    }
  }

  std::vector<EntryPtr> entries;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : pipelines_) {
      entries.push_back(entry);
    }
  }
  for (const auto& entry : entries) {
    if (entry->thread.joinable()) {
      entry->thread.join();
    }
  }
}

void PipelineManager::Drive(const EntryPtr& entry) {
  const auto id = entry->pipeline.id;
  try {
    if (options_.skip_skill_synthesis) {
      Advance(entry, PipelineState::kPlanning, "skill synthesis skipped");
    } else if (Advance(entry, PipelineState::kAnalyzingTask, "analyzing task") &&
               Advance(entry, PipelineState::kSelectingInstructions, "no instruction set selected")) {
      Advance(entry, PipelineState::kPlanning, "instructions ready");
    }

    for (;;) {
      PipelineState state;
      {
        std::lock_guard lock(mutex_);
        if (entry->pipeline.Finished()) {
          break;
        }
        state = entry->pipeline.machine.State();
      }

      if (state == PipelineState::kPlanning) {
        RunPlanning(entry);
      } else if (state == PipelineState::kReadyForExecution) {
        RunBuildAndVerify(entry);
      } else {
        Fail(entry, "unexpected pipeline state " + std::string(StateName(state)));
      }
    }
  } catch (const std::exception& e) {
    FOREMAN_LOG_ERROR("Pipeline driver failed", {observability::StringField("pipeline_id", id), observability::StringField("error", e.what())});
    Fail(entry, e.what());
  }

  Finalize(entry);
}

void PipelineManager::RunPlanning(const EntryPtr& entry) {
  std::string prompt;
  {
    std::lock_guard lock(mutex_);
    const auto&     pipeline = entry->pipeline;
    const bool      replan   = !pipeline.history.empty() && pipeline.history.back().decision == DecisionName(DecisionKind::kReplan);
    prompt                   = replan ? ReplanPrompt(pipeline) : PlanningPrompt(pipeline);
  }

  if (!RunStep(entry, StepRole::kPlanning, prompt)) {
    return;
  }

  {
    std::lock_guard lock(mutex_);
    entry->pipeline.questions = ExtractQuestions(entry->pipeline.Step(StepRole::kPlanning).output);
  }
  if (Advance(entry, PipelineState::kPlanReady, "plan produced")) {
    Advance(entry, PipelineState::kReadyForExecution, "plan accepted");
  }
}

void PipelineManager::RunBuildAndVerify(const EntryPtr& entry) {
  if (!Advance(entry, PipelineState::kExecuting, "building")) {
    return;
  }

  std::string prompt;
  {
    std::lock_guard lock(mutex_);
    prompt = BuildingPrompt(entry->pipeline);
  }
  if (!RunStep(entry, StepRole::kBuilding, prompt)) {
    return;
  }

  if (!Advance(entry, PipelineState::kVerifying, "verifying")) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    prompt = VerificationPrompt(entry->pipeline);
  }
  if (!RunStep(entry, StepRole::kVerifying, prompt)) {
    return;
  }

  std::lock_guard lock(mutex_);
  auto&           pipeline = entry->pipeline;
  if (pipeline.Finished()) {
    return;
  }
  const auto decision = ParseDecision(pipeline.Step(StepRole::kVerifying).output.raw_text);
  FOREMAN_LOG_INFO("Pipeline decision", {observability::StringField("pipeline_id", pipeline.id),
                                         observability::IntField("iteration", pipeline.current_iteration),
                                         observability::StringField("decision", std::string(DecisionName(decision.kind))),
                                         observability::IntField("issues", static_cast<int64_t>(decision.issues.size()))});
  observability::Metrics::Instance().RecordDecision(DecisionName(decision.kind));
  ApplyDecision(pipeline, decision);
}

bool PipelineManager::RunStep(const EntryPtr& entry, StepRole role, const std::string& prompt) {
  StepRequest request;
  PipelineStep step_snapshot;
  int64_t      iteration = 0;
  {
    std::lock_guard lock(mutex_);
    auto&           pipeline = entry->pipeline;
    if (pipeline.Finished()) {
      return false;
    }
    auto& step         = pipeline.Step(role);
    step.Reset();
    step.status        = StepStatus::kRunning;
    step.started_at_ms = util::NowMillis();
    step_snapshot      = step;
    iteration          = pipeline.current_iteration;

    request.pipeline_id       = pipeline.id;
    request.working_dir       = pipeline.working_dir;
    request.role              = role;
    request.prompt            = prompt;
    request.previous_agent_id = entry->last_agent;
  }
  EmitStepStatus(request.pipeline_id, step_snapshot);

  observability::SpanScope span("pipeline.step");
  span.SetAttribute("pipeline.id", request.pipeline_id);
  span.SetAttribute("pipeline.step.role", RoleName(role));
  span.SetAttribute("pipeline.iteration", iteration);

  const auto started = std::chrono::steady_clock::now();

  auto on_spawned = [this, entry, role](const std::string& agent_id) {
    bool cancelled = false;
    {
      std::lock_guard lock(mutex_);
      entry->owned_agents.push_back(agent_id);
      entry->last_agent = agent_id;
      if (entry->pipeline.Finished()) {
        cancelled = true;
      } else {
        entry->pipeline.Step(role).agent_id = agent_id;
      }
    }
    if (cancelled) {
      executor_->Release(agent_id);
    }
  };

  auto result = executor_->Run(request, on_spawned);

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveStepDurationMs(RoleName(role), elapsed_ms);

  bool finished = false;
  {
    std::lock_guard lock(mutex_);
    auto&           pipeline = entry->pipeline;
    finished                 = pipeline.Finished();
    if (!finished) {
      auto& step           = pipeline.Step(role);
      step.status          = result.ok ? StepStatus::kCompleted : StepStatus::kFailed;
      step.output          = std::move(result.output);
      step.completed_at_ms = util::NowMillis();
      if (!result.agent_id.empty()) {
        step.agent_id = result.agent_id;
      }
      step_snapshot = step;
    }
  }
  if (finished) {
    span.AddEvent("pipeline finished during step");
    return false;
  }

  EmitStepStatus(request.pipeline_id, step_snapshot);
  if (!result.ok) {
    span.RecordException(result.error);
    Fail(entry, std::string(RoleName(role)) + " step failed: " + result.error);
    return false;
  }
  EmitStepCompleted(request.pipeline_id, step_snapshot);
  return true;
}

bool PipelineManager::Advance(const EntryPtr& entry, PipelineState to, const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (entry->pipeline.Finished()) {
    return false;
  }
  entry->pipeline.machine.Apply(to, reason);
  return true;
}

void PipelineManager::Fail(const EntryPtr& entry, const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (entry->pipeline.Finished()) {
    return;
  }
  try {
    MarkFailed(entry->pipeline, reason);
  } catch (const util::InvalidTransition& e) {
    // no failing edge from the current state; finalize the record anyway
    FOREMAN_LOG_ERROR("Pipeline could not reach Failed",
                      {observability::StringField("pipeline_id", entry->pipeline.id), observability::StringField("error", e.what())});
    entry->pipeline.status          = "failed";
    entry->pipeline.failure_reason  = reason;
    entry->pipeline.completed_at_ms = util::NowMillis();
  }
}

void PipelineManager::Finalize(const EntryPtr& entry) {
  std::vector<std::string> agents;
  Pipeline                 snapshot;
  bool                     cancelled = false;
  {
    std::lock_guard lock(mutex_);
    agents    = entry->owned_agents;
    snapshot  = entry->pipeline;
    cancelled = entry->cancelled;
  }

  ReleaseAgents(agents);

  if (snapshot.status == "completed") {
    FOREMAN_LOG_INFO("Pipeline completed",
                     {observability::StringField("pipeline_id", snapshot.id), observability::IntField("iterations", snapshot.current_iteration)});
  } else {
    FOREMAN_LOG_WARN("Pipeline failed", {observability::StringField("pipeline_id", snapshot.id),
                                         observability::StringField("state", std::string(StateName(snapshot.machine.State()))),
                                         observability::StringField("reason", snapshot.failure_reason)});
  }

  // Cancel already announced the outcome
  if (!cancelled) {
    EmitCompleted(snapshot);
  }

  {
    std::lock_guard lock(mutex_);
    entry->done = true;
  }
  done_cv_.notify_all();
}

void PipelineManager::ReleaseAgents(const std::vector<std::string>& agent_ids) {
  for (const auto& agent_id : agent_ids) {
    executor_->Release(agent_id);
  }
}

void PipelineManager::ReapFinished() {
  std::vector<std::thread> threads;
  {
    std::lock_guard lock(mutex_);
    for (auto& [id, entry] : pipelines_) {
      if (entry->done && entry->thread.joinable()) {
        threads.push_back(std::move(entry->thread));
      }
    }
  }
  for (auto& thread : threads) {
    thread.join();
  }
}

void PipelineManager::EmitStepStatus(const std::string& pipeline_id, const PipelineStep& step) {
  if (!events_) {
    return;
  }
  Struct payload;
  auto&  fields          = *payload.mutable_fields();
  fields["pipeline_id"]  = util::StringValue(pipeline_id);
  fields["step_number"]  = util::NumberValue(step.step_number);
  fields["status"]       = util::StringValue(StepStatusName(step.status));
  fields["agent_id"]     = util::StringValue(step.agent_id);
  events_->Emit("auto_pipeline:step_status", std::move(payload));
}

void PipelineManager::EmitStepCompleted(const std::string& pipeline_id, const PipelineStep& step) {
  if (!events_) {
    return;
  }
  Struct payload;
  auto&  fields         = *payload.mutable_fields();
  fields["pipeline_id"] = util::StringValue(pipeline_id);
  fields["step_number"] = util::NumberValue(step.step_number);
  fields["step_type"]   = util::StringValue(RoleName(step.role));
  events_->Emit("auto_pipeline:step_completed", std::move(payload));
}

void PipelineManager::EmitCompleted(const Pipeline& pipeline) {
  if (!events_) {
    return;
  }
  Struct payload;
  auto&  fields         = *payload.mutable_fields();
  fields["pipeline_id"] = util::StringValue(pipeline.id);
  fields["status"]      = util::StringValue(pipeline.status == "completed" ? "success" : "failed");
  fields["decision"]    = util::StringValue(pipeline.final_decision);
  fields["reason"]      = util::StringValue(pipeline.failure_reason);
  if (!pipeline.history.empty()) {
    const auto& last      = pipeline.history.back();
    fields["reasoning"]   = util::StringValue(last.reasoning);
    fields["issues"]      = StringList(last.issues);
    fields["suggestions"] = StringList(last.suggestions);
  } else {
    fields["reasoning"]   = util::StringValue("");
    fields["issues"]      = StringList({});
    fields["suggestions"] = StringList({});
  }
  events_->Emit("auto_pipeline:completed", std::move(payload));
}

} // namespace foreman::pipeline
