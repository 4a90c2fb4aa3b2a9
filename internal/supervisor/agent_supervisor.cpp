#include "agent_supervisor.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace foreman::supervisor {

namespace {

using foreman::v1::AgentStatus;

constexpr const char* kCrashMessage = "Process terminated unexpectedly";

const char* StatusName(AgentStatus status) {
  switch (status) {
    case foreman::v1::AGENT_STATUS_IDLE:
      return "idle";
    case foreman::v1::AGENT_STATUS_PROCESSING:
      return "processing";
    case foreman::v1::AGENT_STATUS_WAITING_FOR_INPUT:
      return "waiting_for_input";
    case foreman::v1::AGENT_STATUS_STOPPED:
      return "stopped";
    case foreman::v1::AGENT_STATUS_ERROR:
      return "error";
    default:
      return "unspecified";
  }
}

bool IsSettled(AgentStatus status) {
  return status == foreman::v1::AGENT_STATUS_WAITING_FOR_INPUT || status == foreman::v1::AGENT_STATUS_STOPPED || status == foreman::v1::AGENT_STATUS_ERROR;
}

bool IsFinal(AgentStatus status) {
  return status == foreman::v1::AGENT_STATUS_STOPPED || status == foreman::v1::AGENT_STATUS_ERROR;
}

google::protobuf::Value Number(uint64_t value) {
  return util::NumberValue(static_cast<double>(value));
}

// {"type":"user","message":{"role":"user","content":[{"type":"text","text":...}]}}
std::string UserTurnLine(const std::string& text) {
  google::protobuf::Struct block;
  (*block.mutable_fields())["type"] = util::StringValue("text");
  (*block.mutable_fields())["text"] = util::StringValue(text);

  google::protobuf::Struct message;
  (*message.mutable_fields())["role"] = util::StringValue("user");
  *(*message.mutable_fields())["content"].mutable_list_value()->add_values()->mutable_struct_value() = block;

  google::protobuf::Struct line;
  (*line.mutable_fields())["type"]                            = util::StringValue("user");
  *(*line.mutable_fields())["message"].mutable_struct_value() = message;
  return util::ToJson(line);
}

void CopyFinalStats(db::model::RunRecord& run, const AgentStatistics& stats) {
  run.total_prompts      = stats.total_prompts;
  run.total_tool_calls   = stats.total_tool_calls;
  run.total_output_bytes = stats.total_output_bytes;
  run.total_tokens_used  = stats.total_tokens_used;
  run.total_cost_usd     = stats.total_cost_usd;
  if (!stats.model_usage.empty()) {
    run.model_usage_json = stats.ModelUsageJson();
  }
}

} // namespace

AgentSupervisor::AgentSupervisor(foreman::runtime::config::WorkerConfig config, std::shared_ptr<ProcessLauncher> launcher,
                                 std::shared_ptr<runs::RunStore> runs, std::shared_ptr<persistence::PersistenceQueue> persistence,
                                 std::shared_ptr<events::EventSink> events)
    : command_(config),
      output_buffer_size_(config.output_buffer_size() > 0 ? config.output_buffer_size() : kDefaultOutputBufferSize),
      stop_grace_(config.stop_grace_ms() > 0 ? config.stop_grace_ms() : 2000),
      launcher_(std::move(launcher)),
      runs_(std::move(runs)),
      persistence_(std::move(persistence)),
      events_(std::move(events)) {
  if (!launcher_) {
    throw std::invalid_argument("AgentSupervisor requires a process launcher");
  }
}

AgentSupervisor::~AgentSupervisor() {
  Shutdown();
}

std::string AgentSupervisor::Spawn(const SpawnOptions& options) {
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      throw util::InvalidState("supervisor is shutting down");
    }
  }

  std::error_code ec;
  if (options.working_dir.empty() || !std::filesystem::is_directory(options.working_dir, ec)) {
    throw util::SpawnError("Working directory does not exist: " + options.working_dir);
  }

  const auto agent_id = util::NewId();
  auto       spec     = command_.Build(agent_id, options.working_dir, options.model);
  const auto model    = command_.ResolveModel(options.model);

  auto       process = launcher_->Launch(spec);
  const auto pid     = process->Pid();

  const auto now      = util::NowMillis();
  auto       worker   = std::make_shared<Worker>();
  worker->agent_id    = agent_id;
  worker->pipeline_id = options.pipeline_id;
  worker->info.set_agent_id(agent_id);
  worker->info.set_working_dir(options.working_dir);
  worker->info.set_status(foreman::v1::AGENT_STATUS_IDLE);
  worker->info.set_model(model.value_or(""));
  worker->info.set_source(options.source);
  worker->info.set_pipeline_id(options.pipeline_id);
  worker->info.set_started_at_ms(now);
  worker->info.set_last_activity_ms(now);
  worker->stats.session_started_at_ms = now;
  worker->stats.last_activity_ms      = now;
  worker->process                     = std::move(process);

  if (runs_) {
    db::model::RunRecord run;
    run.agent_id         = agent_id;
    run.working_dir      = options.working_dir;
    run.source           = options.source;
    run.pipeline_id      = options.pipeline_id;
    run.status           = foreman::v1::RUN_STATUS_RUNNING;
    run.started_at_ms    = now;
    run.last_activity_ms = now;
    run.can_resume       = true;
    (void)runs_->Create(std::move(run)); // logged by the store
  }

  const auto info = worker->info;
  {
    std::lock_guard lock(mutex_);
    workers_[agent_id] = worker;
  }

  try {
    worker->stdout_thread = std::thread(&AgentSupervisor::ReadStdout, this, worker);
    worker->stderr_thread = std::thread(&AgentSupervisor::ReadStderr, this, worker);
  } catch (const std::system_error& e) {
    worker->process->Terminate(std::chrono::milliseconds(0));
    JoinStreams(worker);
    {
      std::lock_guard lock(mutex_);
      workers_.erase(agent_id);
    }
    throw util::SpawnError(std::string("failed to start stream threads: ") + e.what());
  }

  FOREMAN_LOG_INFO("worker spawned", {observability::StringField("agent_id", agent_id), observability::StringField("working_dir", options.working_dir),
                                      observability::StringField("source", options.source), observability::IntField("pid", pid),
                                      observability::StringField("model", model.value_or("default"))});

  EmitStatus(info);
  UpdateLiveGauge();
  return agent_id;
}

void AgentSupervisor::SendInput(const std::string& agent_id, const std::string& text) {
  WorkerPtr              worker;
  foreman::v1::AgentInfo info;
  bool                   first_prompt   = false;
  bool                   status_changed = false;
  uint64_t               total_prompts  = 0;
  const auto             now            = util::NowMillis();
  {
    std::lock_guard lock(mutex_);
    worker = FindLocked(agent_id);
    if (!worker) {
      throw util::NotFound("Agent not found: " + agent_id);
    }
    if (!worker->live || IsFinal(worker->info.status())) {
      throw util::InvalidState("Agent is not running: " + agent_id);
    }

    worker->info.set_pending_input(false);
    worker->info.set_is_processing(true);
    worker->info.set_last_activity_ms(now);
    worker->turn_used_tool = false;
    worker->turn_failed    = false;
    status_changed         = SetStatusLocked(*worker, foreman::v1::AGENT_STATUS_PROCESSING);

    worker->stats.IncrementPrompts();
    worker->stats.last_activity_ms = now;
    total_prompts                  = worker->stats.total_prompts;
    first_prompt                   = total_prompts == 1;
    info                           = worker->info;
  }

  if (!worker->process->WriteLine(UserTurnLine(text))) {
    throw util::InvalidState("Agent is not accepting input: " + agent_id);
  }

  EmitActivity(agent_id, text);
  if (status_changed) {
    EmitStatus(info);
  }

  if (runs_) {
    auto task = [runs = runs_, agent_id, text, now] { return runs->RecordPrompt(agent_id, text, now); };
    if (!persistence_ || !persistence_->Enqueue({"record_prompt", agent_id, task})) {
      (void)task();
    }
  }
  QueueRunUpdate(agent_id, "prompt_sent", [now, total_prompts, first_prompt, text](db::model::RunRecord& run) {
    run.status           = foreman::v1::RUN_STATUS_RUNNING;
    run.last_activity_ms = now;
    run.total_prompts    = total_prompts;
    if (first_prompt && run.initial_prompt.empty()) {
      run.initial_prompt = text;
    }
  });
}

void AgentSupervisor::Stop(const std::string& agent_id) {
  WorkerPtr              worker;
  foreman::v1::AgentInfo info;
  bool                   status_changed = false;
  {
    std::lock_guard lock(mutex_);
    if (retired_.count(agent_id) > 0) {
      return;
    }
    auto it = workers_.find(agent_id);
    if (it == workers_.end()) {
      throw util::NotFound("Agent not found: " + agent_id);
    }
    worker = it->second;
    // crashed or already stopping; its exit path owns the final status
    if (!worker->live || IsFinal(worker->info.status())) {
      return;
    }
    worker->info.set_is_processing(false);
    worker->info.set_pending_input(false);
    status_changed = SetStatusLocked(*worker, foreman::v1::AGENT_STATUS_STOPPED);
    info           = worker->info;
  }
  status_cv_.notify_all();

  if (status_changed) {
    FOREMAN_LOG_INFO("stopping worker", {observability::StringField("agent_id", agent_id)});
    EmitStatus(info);
  }

  // The stdout thread sees EOF, finalizes the run as stopped and retires the worker.
  worker->process->CloseStdin();
  worker->process->Terminate(stop_grace_);
  JoinStreams(worker);
}

void AgentSupervisor::StopAll() {
  std::vector<std::string> ids;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, worker] : workers_) {
      ids.push_back(id);
    }
  }
  for (const auto& id : ids) {
    try {
      Stop(id);
    } catch (const util::NotFound&) {
      // ended on its own meanwhile
    } catch (const std::exception& e) {
      FOREMAN_LOG_ERROR("failed to stop worker", {observability::StringField("agent_id", id), observability::StringField("error", e.what())});
    }
  }
}

void AgentSupervisor::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutting_down_ = true;
  }
  StopAll();

  std::vector<WorkerPtr> all;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, worker] : workers_) {
      all.push_back(worker);
    }
    for (const auto& [id, worker] : retired_) {
      all.push_back(worker);
    }
  }
  for (const auto& worker : all) {
    JoinStreams(worker);
  }
}

std::optional<foreman::v1::AgentInfo> AgentSupervisor::GetInfo(const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  auto            worker = FindLocked(agent_id);
  if (!worker) {
    return std::nullopt;
  }
  return worker->info;
}

std::vector<foreman::v1::AgentInfo> AgentSupervisor::List() const {
  std::lock_guard                     lock(mutex_);
  std::vector<foreman::v1::AgentInfo> out;
  out.reserve(workers_.size());
  for (const auto& [id, worker] : workers_) {
    out.push_back(worker->info);
  }
  return out;
}

AgentStatistics AgentSupervisor::GetStatistics(const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  auto            worker = FindLocked(agent_id);
  if (!worker) {
    throw util::NotFound("Agent not found: " + agent_id);
  }
  return worker->stats;
}

std::vector<foreman::v1::OutputEvent> AgentSupervisor::GetOutputs(const std::string& agent_id, size_t limit) const {
  std::lock_guard lock(mutex_);
  auto            worker = FindLocked(agent_id);
  if (!worker) {
    throw util::NotFound("Agent not found: " + agent_id);
  }
  const auto& recent = worker->recent;
  const auto  skip   = (limit == 0 || limit >= recent.size()) ? 0 : recent.size() - limit;
  return {recent.begin() + static_cast<std::ptrdiff_t>(skip), recent.end()};
}

foreman::v1::AgentStatus AgentSupervisor::WaitForIdle(const std::string& agent_id, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  auto             worker = FindLocked(agent_id);
  if (!worker) {
    throw util::NotFound("Agent not found: " + agent_id);
  }

  auto settled = [&] { return IsSettled(worker->info.status()) || worker->turn_failed; };
  if (timeout.count() > 0) {
    status_cv_.wait_for(lock, timeout, settled);
  } else {
    status_cv_.wait(lock, settled);
  }
  return worker->info.status();
}

bool AgentSupervisor::LastTurnFailed(const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  auto            worker = FindLocked(agent_id);
  if (!worker) {
    throw util::NotFound("Agent not found: " + agent_id);
  }
  return worker->turn_failed;
}

std::optional<std::string> AgentSupervisor::AgentForSession(const std::string& session_id) const {
  return sessions_.Lookup(session_id);
}

size_t AgentSupervisor::LiveCount() const {
  std::lock_guard lock(mutex_);
  return workers_.size();
}

AgentSupervisor::WorkerPtr AgentSupervisor::FindLocked(const std::string& agent_id) const {
  if (auto it = workers_.find(agent_id); it != workers_.end()) {
    return it->second;
  }
  if (auto it = retired_.find(agent_id); it != retired_.end()) {
    return it->second;
  }
  return nullptr;
}

void AgentSupervisor::ReadStdout(WorkerPtr worker) {
  const protocol::StreamParser parser(worker->agent_id, &sessions_);

  while (auto line = worker->process->ReadLine(OutputStream::kStdout)) {
    if (line->empty()) {
      continue;
    }
    HandleLine(worker, parser, *line);
  }
  OnProcessExit(worker);
}

void AgentSupervisor::ReadStderr(WorkerPtr worker) {
  const protocol::StreamParser parser(worker->agent_id, &sessions_);

  while (auto line = worker->process->ReadLine(OutputStream::kStderr)) {
    if (line->empty()) {
      continue;
    }
    auto event = parser.ParseStderr(*line);
    {
      std::lock_guard lock(mutex_);
      worker->stats.AddOutputBytes(event.byte_size());
      AppendLocked(*worker, event);
    }
    RecordEvent(worker, event);
  }
}

void AgentSupervisor::HandleLine(const WorkerPtr& worker, const protocol::StreamParser& parser, std::string_view line) {
  auto parsed = parser.Parse(line);
  if (parsed.events.empty() && parsed.signal == protocol::LineSignal::kNone) {
    return;
  }

  const auto             now            = util::NowMillis();
  bool                   status_changed = false;
  bool                   turn_finished  = false;
  bool                   turn_failed    = false;
  bool                   new_session    = false;
  std::string            last_output;
  foreman::v1::AgentInfo info;
  AgentStatistics        stats;
  {
    std::lock_guard lock(mutex_);
    auto&           w = *worker;

    if (parsed.session_id && w.info.session_id().empty()) {
      w.info.set_session_id(*parsed.session_id);
      new_session = true;
    }

    w.stats.IncrementToolCalls(parsed.tool_calls);
    for (const auto& event : parsed.events) {
      if (event.output_type() == "result" && parsed.usage) {
        w.stats.MergeResult(*parsed.usage, event.byte_size());
      } else {
        w.stats.AddOutputBytes(event.byte_size());
      }
      AppendLocked(w, event);
    }
    w.stats.last_activity_ms = now;
    w.info.set_last_activity_ms(now);
    if (parsed.last_text) {
      w.last_text = parsed.last_text;
    }

    // Stop and crash are final; late lines no longer move the status.
    if (!IsFinal(w.info.status())) {
      switch (parsed.signal) {
        case protocol::LineSignal::kToolInvoked:
          w.turn_used_tool = true;
          w.info.set_is_processing(true);
          w.info.set_pending_input(false);
          status_changed = SetStatusLocked(w, foreman::v1::AGENT_STATUS_PROCESSING);
          break;
        case protocol::LineSignal::kTurnEnded:
        case protocol::LineSignal::kTurnSucceeded:
          w.turn_used_tool = false;
          w.info.set_pending_input(true);
          w.info.set_is_processing(false);
          status_changed = SetStatusLocked(w, foreman::v1::AGENT_STATUS_WAITING_FOR_INPUT);
          turn_finished  = true;
          last_output    = w.last_text.value_or("");
          break;
        case protocol::LineSignal::kTurnFailed:
          // flags stay as for a continuing turn; WaitForIdle wakes on turn_failed
          w.turn_failed = true;
          turn_failed   = true;
          [[fallthrough]];
        case protocol::LineSignal::kContinuing:
          if (!w.turn_used_tool) {
            w.info.set_is_processing(true);
            w.info.set_pending_input(false);
            status_changed = SetStatusLocked(w, foreman::v1::AGENT_STATUS_PROCESSING);
          }
          break;
        case protocol::LineSignal::kPlainText:
        case protocol::LineSignal::kNone:
          break;
      }
    }

    info  = w.info;
    stats = w.stats;
  }
  if (status_changed || turn_failed) {
    status_cv_.notify_all();
  }
  if (turn_failed) {
    FOREMAN_LOG_WARN("worker reported a failed turn", {observability::StringField("agent_id", worker->agent_id)});
  }

  for (const auto& event : parsed.events) {
    RecordEvent(worker, event);
  }

  if (status_changed) {
    EmitStatus(info);
  }
  if (parsed.usage) {
    EmitStats(worker->agent_id, stats);
  }
  if (turn_finished) {
    EmitInputRequired(worker->agent_id, last_output);
  }

  if (new_session) {
    QueueRunUpdate(worker->agent_id, "session_seen", [session_id = info.session_id()](db::model::RunRecord& run) { run.session_id = session_id; });
  }
  if (turn_finished) {
    QueueRunUpdate(worker->agent_id, "turn_finished", [now, stats](db::model::RunRecord& run) {
      if (db::model::IsLiveRunStatus(run.status)) {
        run.status = foreman::v1::RUN_STATUS_WAITING_INPUT;
      }
      run.last_activity_ms = now;
      CopyFinalStats(run, stats);
    });
  }
}

void AgentSupervisor::AppendLocked(Worker& worker, const foreman::v1::OutputEvent& event) {
  worker.recent.push_back(event);
  while (worker.recent.size() > output_buffer_size_) {
    worker.recent.pop_front();
  }
}

void AgentSupervisor::RecordEvent(const WorkerPtr& worker, const foreman::v1::OutputEvent& event) {
  EmitOutput(event);

  if (!runs_) {
    return;
  }
  db::model::OutputRecord record;
  record.agent_id     = worker->agent_id;
  record.pipeline_id  = worker->pipeline_id;
  record.session_id   = event.session_id();
  record.output_type  = event.output_type();
  record.content      = event.content();
  record.byte_size    = event.byte_size();
  record.timestamp_ms = event.timestamp_ms();
  if (event.has_parsed_json()) {
    record.parsed_json = util::ToJson(event.parsed_json());
  }

  if (persistence_ && persistence_->Enqueue({"record_output", worker->agent_id, [runs = runs_, record] { return runs->RecordOutput(record); }})) {
    return;
  }
  (void)runs_->RecordOutput(std::move(record));
}

void AgentSupervisor::OnProcessExit(const WorkerPtr& worker) {
  const int exit_code = worker->process->Wait();

  const auto             now = util::NowMillis();
  bool                   stopped;
  std::string            error_message;
  foreman::v1::AgentInfo info;
  AgentStatistics        stats;
  {
    std::lock_guard lock(mutex_);
    auto&           w = *worker;
    stopped           = w.info.status() == foreman::v1::AGENT_STATUS_STOPPED;
    if (!stopped) {
      SetStatusLocked(w, foreman::v1::AGENT_STATUS_ERROR);
      if (w.error_message.empty()) {
        w.error_message = kCrashMessage;
      }
    }
    w.live = false;
    w.info.set_is_processing(false);
    w.info.set_pending_input(false);
    w.info.set_last_activity_ms(now);
    w.stats.last_activity_ms = now;
    error_message            = w.error_message;
    info                     = w.info;
    stats                    = w.stats;
  }
  status_cv_.notify_all();

  if (stopped) {
    FOREMAN_LOG_INFO("worker stopped", {observability::StringField("agent_id", worker->agent_id), observability::IntField("exit_code", exit_code)});
  } else {
    FOREMAN_LOG_WARN("worker exited unexpectedly", {observability::StringField("agent_id", worker->agent_id), observability::IntField("exit_code", exit_code)});
  }

  QueueRunUpdate(worker->agent_id, stopped ? "run_stopped" : "run_crashed", [stopped, now, stats, error_message](db::model::RunRecord& run) {
    if (stopped) {
      run.status = foreman::v1::RUN_STATUS_STOPPED;
    } else {
      run.status     = foreman::v1::RUN_STATUS_CRASHED;
      run.can_resume = true;
      if (run.error_message.empty()) {
        run.error_message = error_message;
      }
    }
    run.ended_at_ms      = now;
    run.last_activity_ms = now;
    CopyFinalStats(run, stats);
  });

  EmitStatus(info);
  EmitStats(worker->agent_id, stats);
  Retire(worker);
}

void AgentSupervisor::Retire(const WorkerPtr& worker) {
  std::vector<WorkerPtr> evicted;
  {
    std::lock_guard lock(mutex_);
    workers_.erase(worker->agent_id);
    if (retired_.emplace(worker->agent_id, worker).second) {
      retired_order_.push_back(worker->agent_id);
    }
    while (retired_order_.size() > kRetiredWorkerLimit) {
      auto it = retired_.find(retired_order_.front());
      if (it != retired_.end()) {
        evicted.push_back(it->second);
        retired_.erase(it);
      }
      retired_order_.pop_front();
    }
  }
  sessions_.ForgetAgent(worker->agent_id);
  UpdateLiveGauge();

  for (const auto& old : evicted) {
    JoinStreams(old);
  }
}

void AgentSupervisor::JoinStreams(const WorkerPtr& worker) {
  std::lock_guard lock(worker->join_mutex);
  for (auto* thread : {&worker->stdout_thread, &worker->stderr_thread}) {
    if (thread->joinable() && thread->get_id() != std::this_thread::get_id()) {
      thread->join();
    }
  }
}

bool AgentSupervisor::SetStatusLocked(Worker& worker, foreman::v1::AgentStatus status) {
  if (worker.info.status() == status) {
    return false;
  }
  worker.info.set_status(status);
  return true;
}

void AgentSupervisor::EmitStatus(const foreman::v1::AgentInfo& info) {
  if (!events_) {
    return;
  }
  google::protobuf::Struct payload;
  auto&                    fields = *payload.mutable_fields();
  fields["agent_id"]              = util::StringValue(info.agent_id());
  fields["status"]                = util::StringValue(StatusName(info.status()));
  fields["is_processing"]         = util::BoolValue(info.is_processing());
  fields["pending_input"]         = util::BoolValue(info.pending_input());
  if (!info.session_id().empty()) {
    fields["session_id"] = util::StringValue(info.session_id());
  }
  events_->Emit("agent:status", std::move(payload));
}

void AgentSupervisor::EmitStats(const std::string& agent_id, const AgentStatistics& stats) {
  if (!events_) {
    return;
  }
  google::protobuf::Struct payload;
  auto&                    fields = *payload.mutable_fields();
  fields["agent_id"]              = util::StringValue(agent_id);
  fields["total_prompts"]         = Number(stats.total_prompts);
  fields["total_tool_calls"]      = Number(stats.total_tool_calls);
  fields["total_output_bytes"]    = Number(stats.total_output_bytes);
  if (stats.total_tokens_used) {
    fields["total_tokens_used"] = Number(*stats.total_tokens_used);
  }
  if (stats.total_cost_usd) {
    fields["total_cost_usd"] = util::NumberValue(*stats.total_cost_usd);
  }
  if (auto usage = util::ParseValue(stats.ModelUsageJson())) {
    fields["model_usage"] = *usage;
  }
  if (stats.num_turns) {
    fields["num_turns"] = Number(*stats.num_turns);
  }
  if (stats.duration_ms) {
    fields["duration_ms"] = Number(*stats.duration_ms);
  }
  events_->Emit("agent:stats", std::move(payload));
}

void AgentSupervisor::EmitOutput(const foreman::v1::OutputEvent& event) {
  if (!events_) {
    return;
  }
  google::protobuf::Struct payload;
  auto&                    fields = *payload.mutable_fields();
  fields["agent_id"]              = util::StringValue(event.agent_id());
  fields["output_type"]           = util::StringValue(event.output_type());
  fields["content"]               = util::StringValue(event.content());
  fields["byte_size"]             = Number(event.byte_size());
  fields["timestamp"]             = util::NumberValue(static_cast<double>(event.timestamp_ms()));
  if (event.has_parsed_json()) {
    fields["parsed_json"] = event.parsed_json();
  }
  for (const auto& [key, value] : {std::pair{"session_id", &event.session_id()}, std::pair{"uuid", &event.uuid()},
                                   std::pair{"parent_tool_use_id", &event.parent_tool_use_id()}, std::pair{"subtype", &event.subtype()}}) {
    if (!value->empty()) {
      fields[key] = util::StringValue(*value);
    }
  }
  events_->Emit("agent:output", std::move(payload));
}

void AgentSupervisor::EmitInputRequired(const std::string& agent_id, const std::string& last_output) {
  if (!events_) {
    return;
  }
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["agent_id"]    = util::StringValue(agent_id);
  (*payload.mutable_fields())["last_output"] = util::StringValue(last_output);
  events_->Emit("agent:input_required", std::move(payload));
}

void AgentSupervisor::EmitActivity(const std::string& agent_id, const std::string& prompt) {
  if (!events_) {
    return;
  }
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["agent_id"] = util::StringValue(agent_id);
  (*payload.mutable_fields())["activity"] = util::StringValue("prompt");
  (*payload.mutable_fields())["prompt"]   = util::StringValue(prompt);
  events_->Emit("agent:activity", std::move(payload));
}

void AgentSupervisor::QueueRunUpdate(const std::string& agent_id, const char* label, runs::RunStore::Mutator mutate) {
  if (!runs_) {
    return;
  }
  auto task = [runs = runs_, agent_id, mutate = std::move(mutate)] { return runs->Update(agent_id, mutate); };
  if (persistence_ && persistence_->Enqueue({label, agent_id, task})) {
    return;
  }
  (void)task();
}

void AgentSupervisor::UpdateLiveGauge() {
  observability::Metrics::Instance().SetLiveWorkers(LiveCount());
}

} // namespace foreman::supervisor
