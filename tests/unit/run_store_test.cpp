#include "internal/runs/run_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using foreman::db::model::RunRecord;
using foreman::runs::RunStore;

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

std::shared_ptr<RunStore> MakeStore() {
  return std::make_shared<RunStore>(std::make_shared<foreman::db::memory::MemoryRepository>());
}

RunRecord MakeRun(const std::string& agent_id, foreman::v1::RunStatus status, int64_t started_at_ms) {
  RunRecord run;
  run.agent_id      = agent_id;
  run.working_dir   = "/tmp";
  run.source        = "manual";
  run.status        = status;
  run.started_at_ms = started_at_ms;
  return run;
}

void TestCreateAndUpdate() {
  auto store = MakeStore();
  assert(store->Create(MakeRun("agent-1", foreman::v1::RUN_STATUS_RUNNING, 100)));
  assert(!store->Create(MakeRun("agent-1", foreman::v1::RUN_STATUS_RUNNING, 100)));

  assert(store->Update("agent-1", [](RunRecord& run) {
    run.status         = foreman::v1::RUN_STATUS_WAITING_INPUT;
    run.total_cost_usd = 0.1;
  }));

  const auto run = store->Get("agent-1");
  assert(run.has_value());
  assert(run->status == foreman::v1::RUN_STATUS_WAITING_INPUT);
  assert(run->total_cost_usd == 0.1);
}

void TestUpdateOfUnknownRunReportsNotFound() {
  auto       store  = MakeStore();
  const auto result = store->Update("ghost", [](RunRecord&) {});
  assert(result.code == foreman::db::ErrorCode::NotFound);
}

void TestReconcileMarksOnlyLiveRuns() {
  auto store = MakeStore();
  assert(store->Create(MakeRun("running", foreman::v1::RUN_STATUS_RUNNING, 100)));
  assert(store->Create(MakeRun("waiting", foreman::v1::RUN_STATUS_WAITING_INPUT, 100)));
  assert(store->Create(MakeRun("done", foreman::v1::RUN_STATUS_COMPLETED, 100)));

  assert(store->ReconcileStaleRuns(5000) == 2);

  const auto running = store->Get("running");
  assert(running->status == foreman::v1::RUN_STATUS_CRASHED);
  assert(running->can_resume);
  assert(running->ended_at_ms == 5000);
  assert(running->error_message == foreman::db::kRestartErrorMessage);

  assert(store->Get("done")->status == foreman::v1::RUN_STATUS_COMPLETED);
  assert(store->Resumable().size() == 2);

  // a second pass finds nothing left to reconcile
  assert(store->ReconcileStaleRuns(6000) == 0);
}

void TestPromptsKeepOrder() {
  auto store = MakeStore();
  assert(store->Create(MakeRun("agent-1", foreman::v1::RUN_STATUS_RUNNING, 100)));
  assert(store->RecordPrompt("agent-1", "first", 1));
  assert(store->RecordPrompt("agent-1", "second", 2));

  const auto prompts = store->Prompts("agent-1");
  assert(prompts.size() == 2);
  assert(prompts[0].prompt == "first");
  assert(prompts[1].prompt == "second");
}

void TestCleanupRemovesOldRuns() {
  auto          store = MakeStore();
  const int64_t now   = 100 * kDayMs;
  assert(store->Create(MakeRun("old", foreman::v1::RUN_STATUS_COMPLETED, now - 40 * kDayMs)));
  assert(store->Create(MakeRun("recent", foreman::v1::RUN_STATUS_COMPLETED, now - 2 * kDayMs)));
  assert(store->RecordPrompt("old", "bye", now - 40 * kDayMs));

  assert(store->CleanupOlderThan(30, now) == 1);
  assert(!store->Get("old").has_value());
  assert(store->Prompts("old").empty());
  assert(store->Get("recent").has_value());

  const auto stats = store->Stats();
  assert(stats.total_runs == 1);
  assert(stats.by_source.at("manual") == 1);
}

} // namespace

int main() {
  TestCreateAndUpdate();
  TestUpdateOfUnknownRunReportsNotFound();
  TestReconcileMarksOnlyLiveRuns();
  TestPromptsKeepOrder();
  TestCleanupRemovesOldRuns();

  std::cout << "foreman_unit_run_store: pass\n";
  return 0;
}
