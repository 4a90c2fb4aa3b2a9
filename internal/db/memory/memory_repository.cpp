#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace foreman::db::memory {

namespace {

bool Matches(const model::RunRecord& run, const model::RunQuery& query) {
  if (query.status && run.status != *query.status) return false;
  if (!query.working_dir.empty() && run.working_dir != query.working_dir) return false;
  if (!query.source.empty() && run.source != query.source) return false;
  if (query.date_from_ms > 0 && run.started_at_ms < query.date_from_ms) return false;
  if (query.date_to_ms > 0 && run.started_at_ms > query.date_to_ms) return false;
  return true;
}

void SortNewestFirst(std::vector<model::RunRecord>& runs) {
  std::stable_sort(runs.begin(), runs.end(), [](const model::RunRecord& a, const model::RunRecord& b) {
    if (a.started_at_ms != b.started_at_ms) return a.started_at_ms > b.started_at_ms;
    return a.id > b.id;
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, model::RunRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.runs.contains(r.agent_id)) return Result::Err(ErrorCode::AlreadyExists, "run exists for agent " + r.agent_id);
  r.id              = s.next_run_id++;
  s.runs[r.agent_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.runs.find(r.agent_id);
  if (it == s.runs.end()) return Result::Err(ErrorCode::NotFound, "no run for agent " + r.agent_id);
  const auto id = it->second.id;
  it->second    = r;
  it->second.id = id;
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& agent_id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(agent_id);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RunRecord> MemoryRepository::QueryRuns(Transaction& t, const model::RunQuery& query) {
  std::vector<model::RunRecord> matched;
  for (const auto& [_, run] : TX(t).View().runs) {
    if (Matches(run, query)) matched.push_back(run);
  }
  SortNewestFirst(matched);

  const std::size_t begin = std::min<std::size_t>(query.offset, matched.size());
  std::size_t       end   = matched.size();
  if (query.limit > 0) end = std::min<std::size_t>(begin + query.limit, end);
  return {matched.begin() + static_cast<std::ptrdiff_t>(begin), matched.begin() + static_cast<std::ptrdiff_t>(end)};
}

std::vector<model::RunRecord> MemoryRepository::ListRunsByStatus(Transaction& t, foreman::v1::RunStatus status) {
  model::RunQuery query;
  query.status = status;
  return QueryRuns(t, query);
}

Result MemoryRepository::MarkStaleRunsCrashed(Transaction& t, int64_t now_ms, uint64_t& affected) {
  affected = 0;
  for (auto& [_, run] : TX(t).Mutable().runs) {
    if (!model::IsLiveRunStatus(run.status)) continue;
    run.status           = foreman::v1::RUN_STATUS_CRASHED;
    run.ended_at_ms      = now_ms;
    run.last_activity_ms = now_ms;
    run.can_resume       = true;
    if (run.error_message.empty()) run.error_message = kRestartErrorMessage;
    ++affected;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteRunsOlderThan(Transaction& t, int64_t cutoff_ms, uint64_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = 0;
  for (auto it = s.runs.begin(); it != s.runs.end();) {
    if (it->second.started_at_ms >= cutoff_ms) {
      ++it;
      continue;
    }
    const auto agent_id = it->first;
    std::erase_if(s.prompts, [&](const model::PromptRecord& p) { return p.agent_id == agent_id; });
    std::erase_if(s.outputs, [&](const model::OutputRecord& o) { return o.agent_id == agent_id; });
    it = s.runs.erase(it);
    ++deleted;
  }
  return Result::Ok();
}

model::RunStatsRecord MemoryRepository::GetRunStats(Transaction& t) {
  model::RunStatsRecord stats;
  for (const auto& [_, run] : TX(t).View().runs) {
    ++stats.total_runs;
    ++stats.by_status[model::RunStatusName(run.status)];
    ++stats.by_source[run.source];
    if (run.total_cost_usd) stats.total_cost_usd += *run.total_cost_usd;
    if (run.can_resume && run.status == foreman::v1::RUN_STATUS_CRASHED) ++stats.resumable_runs;
  }
  return stats;
}

// ------------------------------------------------------------------
// Prompts
// ------------------------------------------------------------------

Result MemoryRepository::InsertPrompt(Transaction& t, model::PromptRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_prompt_id++;
  s.prompts.push_back(r);
  return Result::Ok();
}

std::vector<model::PromptRecord> MemoryRepository::GetPrompts(Transaction& t, const std::string& agent_id) {
  std::vector<model::PromptRecord> out;
  for (const auto& p : TX(t).View().prompts) {
    if (p.agent_id == agent_id) out.push_back(p);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.timestamp_ms < b.timestamp_ms; });
  return out;
}

// ------------------------------------------------------------------
// Output history
// ------------------------------------------------------------------

Result MemoryRepository::InsertOutput(Transaction& t, model::OutputRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_output_id++;
  s.outputs.push_back(r);
  return Result::Ok();
}

std::vector<model::OutputRecord> MemoryRepository::GetOutputs(Transaction& t, const model::OutputQuery& query) {
  std::vector<model::OutputRecord> out;
  for (const auto& o : TX(t).View().outputs) {
    if (!query.agent_id.empty() && o.agent_id != query.agent_id) continue;
    if (!query.pipeline_id.empty() && o.pipeline_id != query.pipeline_id) continue;
    out.push_back(o);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.timestamp_ms < b.timestamp_ms; });
  if (query.limit > 0 && out.size() > query.limit) {
    out.erase(out.begin(), out.end() - query.limit);
  }
  return out;
}

} // namespace foreman::db::memory
