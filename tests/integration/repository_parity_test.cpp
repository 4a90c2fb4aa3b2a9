#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if FOREMAN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if FOREMAN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using foreman::db::Repository;
using foreman::db::memory::MemoryRepository;
using foreman::db::model::OutputQuery;
using foreman::db::model::OutputRecord;
using foreman::db::model::PromptRecord;
using foreman::db::model::RunQuery;
using foreman::db::model::RunRecord;
using foreman::v1::RUN_STATUS_COMPLETED;
using foreman::v1::RUN_STATUS_CRASHED;
using foreman::v1::RUN_STATUS_RUNNING;
using foreman::v1::RUN_STATUS_WAITING_INPUT;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RunRecord MakeRun(const std::string& agent_id, foreman::v1::RunStatus status, int64_t started_at_ms, const std::string& source = "manual") {
  RunRecord run;
  run.agent_id         = agent_id;
  run.working_dir      = "/work/" + source;
  run.source           = source;
  run.status           = status;
  run.started_at_ms    = started_at_ms;
  run.last_activity_ms = started_at_ms;
  run.initial_prompt   = "hello";
  return run;
}

void VerifyRunLifecycle(Repository& repo, const std::string& agent_id) {
  auto tx = repo.Begin();

  auto run = MakeRun(agent_id, RUN_STATUS_RUNNING, NowMs());
  assert(repo.InsertRun(*tx, run));
  assert(run.id != 0);

  auto duplicate = MakeRun(agent_id, RUN_STATUS_RUNNING, NowMs());
  assert(repo.InsertRun(*tx, duplicate).code == foreman::db::ErrorCode::AlreadyExists);

  auto loaded = repo.GetRun(*tx, agent_id);
  assert(loaded.has_value());
  assert(!loaded->total_cost_usd.has_value());
  assert(loaded->initial_prompt == "hello");

  loaded->status            = RUN_STATUS_COMPLETED;
  loaded->ended_at_ms       = NowMs();
  loaded->session_id        = "sess-" + agent_id;
  loaded->total_prompts     = 2;
  loaded->total_tokens_used = 1234;
  loaded->total_cost_usd    = 0.5;
  loaded->model_usage_json  = R"({"claude-sonnet":{"input_tokens":10}})";
  assert(repo.UpdateRun(*tx, *loaded));

  auto updated = repo.GetRun(*tx, agent_id);
  assert(updated.has_value());
  assert(updated->status == RUN_STATUS_COMPLETED);
  assert(updated->session_id == "sess-" + agent_id);
  assert(updated->total_tokens_used == 1234u);
  assert(updated->total_cost_usd == 0.5);
  assert(updated->model_usage_json == loaded->model_usage_json);

  RunRecord missing = MakeRun(agent_id + "-missing", RUN_STATUS_RUNNING, NowMs());
  assert(repo.UpdateRun(*tx, missing).code == foreman::db::ErrorCode::NotFound);

  tx->Commit();
}

void VerifyPromptsAndOutputs(Repository& repo, const std::string& agent_id) {
  auto tx  = repo.Begin();
  auto run = MakeRun(agent_id, RUN_STATUS_RUNNING, NowMs());
  assert(repo.InsertRun(*tx, run));

  for (int i = 0; i < 3; ++i) {
    PromptRecord prompt{.agent_id = agent_id, .prompt = "prompt " + std::to_string(i), .timestamp_ms = 1000 + i};
    assert(repo.InsertPrompt(*tx, prompt));

    OutputRecord output;
    output.agent_id     = agent_id;
    output.pipeline_id  = "pipe-" + agent_id;
    output.output_type  = "text";
    output.content      = "line " + std::to_string(i);
    output.byte_size    = output.content.size();
    output.timestamp_ms = 2000 + i;
    assert(repo.InsertOutput(*tx, output));
  }

  const auto prompts = repo.GetPrompts(*tx, agent_id);
  assert(prompts.size() == 3);
  assert(prompts.front().prompt == "prompt 0");

  const auto all = repo.GetOutputs(*tx, OutputQuery{.agent_id = agent_id});
  assert(all.size() == 3);
  assert(all.front().content == "line 0");

  const auto recent = repo.GetOutputs(*tx, OutputQuery{.agent_id = agent_id, .limit = 2});
  assert(recent.size() == 2);
  assert(recent.front().content == "line 1");
  assert(recent.back().content == "line 2");

  const auto by_pipeline = repo.GetOutputs(*tx, OutputQuery{.pipeline_id = "pipe-" + agent_id});
  assert(by_pipeline.size() == 3);

  tx->Commit();
}

void VerifyQueryFilters(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  auto a  = MakeRun(prefix + "-q1", RUN_STATUS_COMPLETED, 10'000, "pipeline");
  auto b  = MakeRun(prefix + "-q2", RUN_STATUS_CRASHED, 20'000, "pipeline");
  auto c  = MakeRun(prefix + "-q3", RUN_STATUS_COMPLETED, 30'000, "ui");
  a.working_dir = b.working_dir = c.working_dir = "/work/" + prefix;
  assert(repo.InsertRun(*tx, a));
  assert(repo.InsertRun(*tx, b));
  assert(repo.InsertRun(*tx, c));

  RunQuery by_source;
  by_source.working_dir  = "/work/" + prefix;
  by_source.source       = "pipeline";
  by_source.date_from_ms = 5'000;
  by_source.date_to_ms   = 35'000;
  const auto pipeline_runs = repo.QueryRuns(*tx, by_source);
  assert(pipeline_runs.size() == 2);
  assert(pipeline_runs.front().agent_id == prefix + "-q2");

  RunQuery completed;
  completed.working_dir  = "/work/" + prefix;
  completed.status       = RUN_STATUS_COMPLETED;
  completed.date_from_ms = 5'000;
  completed.date_to_ms   = 35'000;
  completed.limit        = 1;
  const auto newest = repo.QueryRuns(*tx, completed);
  assert(newest.size() == 1);
  assert(newest.front().agent_id == prefix + "-q3");

  completed.offset = 1;
  const auto older = repo.QueryRuns(*tx, completed);
  assert(older.size() == 1);
  assert(older.front().agent_id == prefix + "-q1");

  tx->Commit();
}

void VerifyStaleRunReconciliation(Repository& repo, const std::string& prefix) {
  {
    auto tx      = repo.Begin();
    auto running = MakeRun(prefix + "-running", RUN_STATUS_RUNNING, NowMs());
    auto waiting = MakeRun(prefix + "-waiting", RUN_STATUS_WAITING_INPUT, NowMs());
    waiting.error_message = "earlier failure";
    auto done             = MakeRun(prefix + "-done", RUN_STATUS_COMPLETED, NowMs());
    assert(repo.InsertRun(*tx, running));
    assert(repo.InsertRun(*tx, waiting));
    assert(repo.InsertRun(*tx, done));
    tx->Commit();
  }

  const int64_t now      = NowMs();
  uint64_t      affected = 0;
  {
    auto tx = repo.Begin();
    assert(repo.MarkStaleRunsCrashed(*tx, now, affected));
    tx->Commit();
  }
  assert(affected >= 2);

  auto tx      = repo.Begin();
  auto running = repo.GetRun(*tx, prefix + "-running");
  assert(running->status == RUN_STATUS_CRASHED);
  assert(running->can_resume);
  assert(running->ended_at_ms == now);
  assert(running->error_message == foreman::db::kRestartErrorMessage);

  auto waiting = repo.GetRun(*tx, prefix + "-waiting");
  assert(waiting->status == RUN_STATUS_CRASHED);
  assert(waiting->error_message == "earlier failure");

  auto done = repo.GetRun(*tx, prefix + "-done");
  assert(done->status == RUN_STATUS_COMPLETED);
  assert(!done->can_resume);

  const auto stats = repo.GetRunStats(*tx);
  assert(stats.resumable_runs >= 2);
  assert(stats.by_status.at("crashed") >= 2);
  tx->Commit();
}

void VerifyCleanupCascades(Repository& repo, const std::string& agent_id) {
  {
    auto tx  = repo.Begin();
    auto old = MakeRun(agent_id, RUN_STATUS_COMPLETED, 1);
    assert(repo.InsertRun(*tx, old));
    PromptRecord prompt{.agent_id = agent_id, .prompt = "old", .timestamp_ms = 1};
    assert(repo.InsertPrompt(*tx, prompt));
    tx->Commit();
  }

  uint64_t deleted = 0;
  auto     tx      = repo.Begin();
  assert(repo.DeleteRunsOlderThan(*tx, 2, deleted));
  assert(deleted >= 1);
  assert(!repo.GetRun(*tx, agent_id).has_value());
  assert(repo.GetPrompts(*tx, agent_id).empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& agent_id) {
  {
    auto tx  = repo.Begin();
    auto run = MakeRun(agent_id, RUN_STATUS_RUNNING, NowMs());
    assert(repo.InsertRun(*tx, run));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetRun(*check_tx, agent_id).has_value());
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& agent_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx  = repo->Begin();
    auto run = MakeRun(agent_id, RUN_STATUS_RUNNING, NowMs());
    assert(repo->InsertRun(*tx, run));
    PromptRecord prompt{.agent_id = agent_id, .prompt = "survive", .timestamp_ms = NowMs()};
    assert(repo->InsertPrompt(*tx, prompt));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto run = repo->GetRun(*tx, agent_id);
  assert(run.has_value());
  assert(run->status == RUN_STATUS_RUNNING);

  const auto prompts = repo->GetPrompts(*tx, agent_id);
  assert(prompts.size() == 1);
  assert(prompts[0].prompt == "survive");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if FOREMAN_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("foreman_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<foreman::db::sqlite::SqliteDB>(db_path);
    foreman::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<foreman::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if FOREMAN_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FOREMAN_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FOREMAN_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<foreman::db::postgres::PgPool>(conninfo);
    foreman::db::postgres::BootstrapSchema(pool);
    return std::make_shared<foreman::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto prefix = backend.name + "-" + std::to_string(NowMs());
  auto       repo   = backend.make_repository();

  VerifyRunLifecycle(*repo, prefix + "-life");
  VerifyPromptsAndOutputs(*repo, prefix + "-io");
  VerifyQueryFilters(*repo, prefix);
  VerifyStaleRunReconciliation(*repo, prefix + "-stale");
  VerifyCleanupCascades(*repo, prefix + "-old");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");

  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FOREMAN_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if FOREMAN_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "foreman_integration_repository_parity: pass\n";
  return 0;
}
