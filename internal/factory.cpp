#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/grpc/agent_server.hpp"
#include "internal/grpc/pipeline_server.hpp"
#include "internal/grpc/run_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/persistence/persistence_queue.hpp"
#include "internal/persistence/persistence_worker.hpp"
#include "internal/pipeline/pipeline_manager.hpp"
#include "internal/pipeline/step_executor.hpp"
#include "internal/runs/run_store.hpp"
#include "internal/service/agent_service.hpp"
#include "internal/service/pipeline_service.hpp"
#include "internal/service/run_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/supervisor/agent_supervisor.hpp"
#include "internal/supervisor/posix_process_launcher.hpp"
#include "internal/util/time.hpp"
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

namespace foreman::factory {

using namespace foreman;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const foreman::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FOREMAN_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    FOREMAN_LOG_INFO("Using sqlite run history", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FOREMAN_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(pool);
    FOREMAN_LOG_INFO("Using postgres run history", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FOREMAN_LOG_WARN("No database configured; run history is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

void Application::Shutdown() {
  if (pipelines) {
    pipelines->Shutdown();
  }
  if (supervisor) {
    supervisor->Shutdown();
  }
  if (persistence_worker) {
    persistence_worker->Stop();
  }
  if (events) {
    events->CloseAll();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const foreman::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Run history
  // ------------------------------------------------------------------
  app.runs = std::make_shared<runs::RunStore>(BuildRepository(config));

  // A previous daemon cannot have left workers behind: their runs are crashed, not live.
  app.runs->ReconcileStaleRuns(util::NowMillis());

  // ------------------------------------------------------------------
  // Background persistence and notifications
  // ------------------------------------------------------------------
  app.persistence_queue  = std::make_shared<persistence::PersistenceQueue>();
  const auto writers     = config.persistence().queue_workers() > 0 ? config.persistence().queue_workers() : 1u;
  app.persistence_worker = std::make_shared<persistence::PersistenceWorker>(app.persistence_queue, writers);
  app.persistence_worker->Start();

  app.events = std::make_shared<events::EventBus>();

  // ------------------------------------------------------------------
  // Workers and pipelines
  // ------------------------------------------------------------------
  app.supervisor = std::make_shared<supervisor::AgentSupervisor>(config.workers(), std::make_shared<supervisor::PosixProcessLauncher>(), app.runs,
                                                                 app.persistence_queue, app.events);

  const auto step_timeout = std::chrono::milliseconds(config.pipeline().step_timeout_ms());
  auto       executor     = std::make_shared<pipeline::AgentStepExecutor>(app.supervisor, step_timeout);

  pipeline::PipelineOptions options;
  options.default_max_iterations = config.pipeline().default_max_iterations();
  options.skip_skill_synthesis   = config.pipeline().skip_skill_synthesis();
  app.pipelines                  = std::make_shared<pipeline::PipelineManager>(std::move(executor), app.events, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.supervisor = app.supervisor;
  ctx.runs       = app.runs;
  ctx.pipelines  = app.pipelines;
  ctx.events     = app.events;

  auto agent_service    = std::make_shared<service::AgentService>(ctx);
  auto run_service      = std::make_shared<service::RunService>(ctx);
  auto pipeline_service = std::make_shared<service::PipelineService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AgentServer>(agent_service));
  app.grpc_services.push_back(std::make_unique<grpc::RunServer>(run_service));
  app.grpc_services.push_back(std::make_unique<grpc::PipelineServer>(pipeline_service));

  return app;
}

} // namespace foreman::factory
