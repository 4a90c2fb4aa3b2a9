#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "foreman/v1.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/grpc/agent_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/pipeline_server.hpp"
#include "internal/grpc/run_server.hpp"
#include "internal/pipeline/pipeline_manager.hpp"
#include "internal/pipeline/step_executor.hpp"
#include "internal/runs/run_store.hpp"
#include "internal/service/agent_service.hpp"
#include "internal/service/pipeline_service.hpp"
#include "internal/service/run_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/supervisor/posix_process_launcher.hpp"
#include "internal/util/errors.hpp"

namespace {

foreman::service::ServiceContext BuildServiceContext() {
  foreman::runtime::config::WorkerConfig config;
  config.set_executable("/nonexistent/foreman-test/claude");

  foreman::service::ServiceContext ctx;
  ctx.events     = std::make_shared<foreman::events::EventBus>();
  ctx.runs       = std::make_shared<foreman::runs::RunStore>(std::make_shared<foreman::db::memory::MemoryRepository>());
  ctx.supervisor = std::make_shared<foreman::supervisor::AgentSupervisor>(config, std::make_shared<foreman::supervisor::PosixProcessLauncher>(),
                                                                          ctx.runs, nullptr, ctx.events);
  ctx.pipelines  = std::make_shared<foreman::pipeline::PipelineManager>(
      std::make_shared<foreman::pipeline::AgentStepExecutor>(ctx.supervisor, std::chrono::minutes(1)), ctx.events,
      foreman::pipeline::PipelineOptions{});
  return ctx;
}

void TestExceptionMapping() {
  using ::grpc::StatusCode;
  assert(foreman::grpc::ToStatus(foreman::util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(foreman::grpc::ToStatus(foreman::util::AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(foreman::grpc::ToStatus(foreman::util::InvalidState("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(foreman::grpc::ToStatus(foreman::util::InvalidTransition("Completed", "Planning")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(foreman::grpc::ToStatus(foreman::util::SpawnError("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(foreman::grpc::ToStatus(std::runtime_error("boom")).error_code() == StatusCode::INTERNAL);
  assert(foreman::grpc::ToStatus(foreman::util::NotFound("Agent not found: a1")).error_message() == "Agent not found: a1");
}

void TestUnknownAgentReturnsNotFound() {
  auto                       ctx = BuildServiceContext();
  foreman::grpc::AgentServer server(std::make_shared<foreman::service::AgentService>(ctx));

  foreman::v1::AgentRef  req;
  foreman::v1::AgentInfo resp;
  req.set_agent_id("missing-agent");
  ::grpc::ServerContext grpc_ctx;

  assert(server.GetAgent(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  google::protobuf::Empty empty;
  ::grpc::ServerContext   stop_ctx;
  assert(server.StopAgent(&stop_ctx, &req, &empty).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEmptyInputReturnsFailedPrecondition() {
  auto                       ctx = BuildServiceContext();
  foreman::grpc::AgentServer server(std::make_shared<foreman::service::AgentService>(ctx));

  foreman::v1::SendInputRequest req;
  req.set_agent_id("agent-1");
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  assert(server.SendInput(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestSpawnInMissingDirectoryReturnsUnavailable() {
  auto                       ctx = BuildServiceContext();
  foreman::grpc::AgentServer server(std::make_shared<foreman::service::AgentService>(ctx));

  foreman::v1::SpawnAgentRequest req;
  req.set_working_dir("/nonexistent/foreman-test/workdir");
  foreman::v1::SpawnAgentResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  const auto status = server.SpawnAgent(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(status.error_message().find("Working directory does not exist") != std::string::npos);
}

void TestUnknownRunReturnsNotFound() {
  auto                     ctx = BuildServiceContext();
  foreman::grpc::RunServer server(std::make_shared<foreman::service::RunService>(ctx));

  foreman::v1::AgentRef  req;
  foreman::v1::RunRecord resp;
  req.set_agent_id("missing-agent");
  ::grpc::ServerContext grpc_ctx;

  assert(server.GetRun(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  foreman::v1::QueryRunsResponse runs;
  google::protobuf::Empty        empty;
  ::grpc::ServerContext          resumable_ctx;
  assert(server.GetResumableRuns(&resumable_ctx, &empty, &runs).ok());
  assert(runs.runs_size() == 0);
}

void TestPipelineErrors() {
  auto                          ctx = BuildServiceContext();
  foreman::grpc::PipelineServer server(std::make_shared<foreman::service::PipelineService>(ctx));

  foreman::v1::StartPipelineRequest start;
  start.set_user_request("add a readme");
  start.set_working_dir("/nonexistent/foreman-test/workdir");
  foreman::v1::Pipeline resp;
  ::grpc::ServerContext start_ctx;
  assert(server.StartPipeline(&start_ctx, &start, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  foreman::v1::PipelineRef ref;
  ref.set_pipeline_id("missing-pipeline");
  ::grpc::ServerContext get_ctx;
  assert(server.GetPipeline(&get_ctx, &ref, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  ::grpc::ServerContext cancel_ctx;
  assert(server.CancelPipeline(&cancel_ctx, &ref, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestUnknownAgentReturnsNotFound();
  TestEmptyInputReturnsFailedPrecondition();
  TestSpawnInMissingDirectoryReturnsUnavailable();
  TestUnknownRunReturnsNotFound();
  TestPipelineErrors();

  std::cout << "foreman_unit_grpc_status: pass\n";
  return 0;
}
