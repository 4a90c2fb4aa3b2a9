#include "run_service.hpp"

#include "internal/runs/run_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace foreman::service {

using namespace foreman::v1;

namespace {

constexpr uint32_t kDefaultRetentionDays = 30;

} // namespace

foreman::v1::RunRecord ToProto(const db::model::RunRecord& record) {
  foreman::v1::RunRecord out;
  out.set_id(record.id);
  out.set_agent_id(record.agent_id);
  out.set_session_id(record.session_id);
  out.set_working_dir(record.working_dir);
  out.set_source(record.source);
  out.set_status(record.status);
  out.set_started_at_ms(record.started_at_ms);
  out.set_ended_at_ms(record.ended_at_ms);
  out.set_last_activity_ms(record.last_activity_ms);
  out.set_initial_prompt(record.initial_prompt);
  out.set_error_message(record.error_message);
  out.set_total_prompts(record.total_prompts);
  out.set_total_tool_calls(record.total_tool_calls);
  out.set_total_output_bytes(record.total_output_bytes);
  out.set_total_tokens_used(record.total_tokens_used.value_or(0));
  out.set_total_cost_usd(record.total_cost_usd.value_or(0.0));
  out.set_model_usage_json(record.model_usage_json);
  out.set_can_resume(record.can_resume);
  out.set_resume_data(record.resume_data);
  out.set_pipeline_id(record.pipeline_id);
  return out;
}

db::model::RunQuery FromProto(const foreman::v1::RunQuery& query) {
  db::model::RunQuery out;
  if (query.status() != RUN_STATUS_UNSPECIFIED) {
    out.status = query.status();
  }
  out.working_dir  = query.working_dir();
  out.source       = query.source();
  out.date_from_ms = query.date_from_ms();
  out.date_to_ms   = query.date_to_ms();
  out.limit        = query.limit();
  out.offset       = query.offset();
  return out;
}

RunService::RunService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

foreman::v1::RunRecord RunService::GetRun(const AgentRef& req) {
  return ObserveRpc("RunService.GetRun", "agent_id", req.agent_id(), [&] {
    auto record = ctx_.runs->Get(req.agent_id());
    if (!record) {
      throw util::NotFound("Run not found: " + req.agent_id());
    }
    return ToProto(*record);
  });
}

QueryRunsResponse RunService::QueryRuns(const foreman::v1::RunQuery& req) {
  return ObserveRpc("RunService.QueryRuns", [&] {
    QueryRunsResponse resp;
    for (const auto& record : ctx_.runs->Query(FromProto(req))) {
      *resp.add_runs() = ToProto(record);
    }
    return resp;
  });
}

QueryRunsResponse RunService::GetResumableRuns() {
  return ObserveRpc("RunService.GetResumableRuns", [&] {
    QueryRunsResponse resp;
    for (const auto& record : ctx_.runs->Resumable()) {
      *resp.add_runs() = ToProto(record);
    }
    return resp;
  });
}

GetPromptsResponse RunService::GetPrompts(const AgentRef& req) {
  return ObserveRpc("RunService.GetPrompts", "agent_id", req.agent_id(), [&] {
    GetPromptsResponse resp;
    for (const auto& prompt : ctx_.runs->Prompts(req.agent_id())) {
      auto* out = resp.add_prompts();
      out->set_id(prompt.id);
      out->set_agent_id(prompt.agent_id);
      out->set_prompt(prompt.prompt);
      out->set_timestamp_ms(prompt.timestamp_ms);
    }
    return resp;
  });
}

RunStats RunService::GetRunStats() {
  return ObserveRpc("RunService.GetRunStats", [&] {
    const auto stats = ctx_.runs->Stats();
    RunStats   resp;
    resp.set_total_runs(stats.total_runs);
    for (const auto& [status, count] : stats.by_status) {
      (*resp.mutable_by_status())[status] = count;
    }
    for (const auto& [source, count] : stats.by_source) {
      (*resp.mutable_by_source())[source] = count;
    }
    resp.set_total_cost_usd(stats.total_cost_usd);
    resp.set_resumable_runs(stats.resumable_runs);
    return resp;
  });
}

CleanupOldRunsResponse RunService::CleanupOldRuns(const CleanupOldRunsRequest& req) {
  return ObserveRpc("RunService.CleanupOldRuns", [&] {
    const uint32_t         days = req.days() > 0 ? req.days() : kDefaultRetentionDays;
    CleanupOldRunsResponse resp;
    resp.set_deleted(ctx_.runs->CleanupOlderThan(days, util::NowMillis()));
    return resp;
  });
}

} // namespace foreman::service
