#include "run_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace foreman::runs {

namespace {
constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;
}

RunStore::RunStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("RunStore requires a repository");
  }
}

db::Result RunStore::Write(const char* op, const std::string& agent_id, const std::function<db::Result(db::Repository&, db::Transaction&)>& body) {
  db::Result result;
  try {
    auto tx = repository_->Begin();
    result  = body(*repository_, *tx);
    if (result) {
      tx->Commit();
    } else {
      tx->Rollback();
    }
  } catch (const std::exception& e) {
    result = db::Result::Err(db::ErrorCode::InternalError, e.what());
  }

  if (!result) {
    FOREMAN_LOG_WARN("run store write failed", {observability::StringField("op", op), observability::StringField("agent_id", agent_id),
                                                observability::StringField("code", db::ErrorCodeName(result.code)),
                                                observability::StringField("error", result.message)});
  }
  return result;
}

template <typename T>
T RunStore::Read(const std::function<T(db::Repository&, db::Transaction&)>& body) {
  auto tx    = repository_->Begin();
  T    value = body(*repository_, *tx);
  tx->Commit();
  return value;
}

db::Result RunStore::Create(db::model::RunRecord record) {
  const auto agent_id = record.agent_id;
  return Write("create_run", agent_id, [&](db::Repository& repo, db::Transaction& tx) { return repo.InsertRun(tx, record); });
}

db::Result RunStore::Update(const std::string& agent_id, const Mutator& mutate) {
  return Write("update_run", agent_id, [&](db::Repository& repo, db::Transaction& tx) {
    auto run = repo.GetRun(tx, agent_id);
    if (!run) return db::Result::Err(db::ErrorCode::NotFound, "no run for agent " + agent_id);
    mutate(*run);
    return repo.UpdateRun(tx, *run);
  });
}

db::Result RunStore::RecordPrompt(const std::string& agent_id, const std::string& prompt, int64_t timestamp_ms) {
  return Write("record_prompt", agent_id, [&](db::Repository& repo, db::Transaction& tx) {
    db::model::PromptRecord record;
    record.agent_id     = agent_id;
    record.prompt       = prompt;
    record.timestamp_ms = timestamp_ms;
    return repo.InsertPrompt(tx, record);
  });
}

db::Result RunStore::RecordOutput(db::model::OutputRecord record) {
  const auto agent_id = record.agent_id;
  return Write("record_output", agent_id, [&](db::Repository& repo, db::Transaction& tx) { return repo.InsertOutput(tx, record); });
}

std::optional<db::model::RunRecord> RunStore::Get(const std::string& agent_id) {
  return Read<std::optional<db::model::RunRecord>>([&](db::Repository& repo, db::Transaction& tx) { return repo.GetRun(tx, agent_id); });
}

std::vector<db::model::RunRecord> RunStore::Query(const db::model::RunQuery& query) {
  return Read<std::vector<db::model::RunRecord>>([&](db::Repository& repo, db::Transaction& tx) { return repo.QueryRuns(tx, query); });
}

std::vector<db::model::RunRecord> RunStore::Resumable() {
  auto crashed = Read<std::vector<db::model::RunRecord>>(
      [](db::Repository& repo, db::Transaction& tx) { return repo.ListRunsByStatus(tx, foreman::v1::RUN_STATUS_CRASHED); });

  std::vector<db::model::RunRecord> out;
  for (auto& run : crashed) {
    if (run.can_resume) out.push_back(std::move(run));
  }
  return out;
}

std::vector<db::model::PromptRecord> RunStore::Prompts(const std::string& agent_id) {
  return Read<std::vector<db::model::PromptRecord>>([&](db::Repository& repo, db::Transaction& tx) { return repo.GetPrompts(tx, agent_id); });
}

std::vector<db::model::OutputRecord> RunStore::Outputs(const db::model::OutputQuery& query) {
  return Read<std::vector<db::model::OutputRecord>>([&](db::Repository& repo, db::Transaction& tx) { return repo.GetOutputs(tx, query); });
}

db::model::RunStatsRecord RunStore::Stats() {
  return Read<db::model::RunStatsRecord>([](db::Repository& repo, db::Transaction& tx) { return repo.GetRunStats(tx); });
}

uint64_t RunStore::ReconcileStaleRuns(int64_t now_ms) {
  uint64_t affected = 0;
  auto     result   = Write("reconcile_runs", "", [&](db::Repository& repo, db::Transaction& tx) { return repo.MarkStaleRunsCrashed(tx, now_ms, affected); });
  if (!result) return 0;

  if (affected > 0) {
    FOREMAN_LOG_INFO("marked stale runs as crashed", {observability::IntField("count", static_cast<int64_t>(affected))});
  }
  return affected;
}

uint64_t RunStore::CleanupOlderThan(uint32_t days, int64_t now_ms) {
  const int64_t cutoff  = now_ms - static_cast<int64_t>(days) * kMillisPerDay;
  uint64_t      deleted = 0;
  auto result = Write("cleanup_runs", "", [&](db::Repository& repo, db::Transaction& tx) { return repo.DeleteRunsOlderThan(tx, cutoff, deleted); });
  return result ? deleted : 0;
}

} // namespace foreman::runs
