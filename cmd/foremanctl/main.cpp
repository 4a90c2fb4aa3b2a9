#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "foreman/v1.hpp"

using namespace foreman::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  foremanctl <addr> spawn <working_dir> [model] [initial_prompt]\n"
            << "  foremanctl <addr> stop <agent_id>\n"
            << "  foremanctl <addr> send <agent_id> <text>\n"
            << "  foremanctl <addr> list\n"
            << "  foremanctl <addr> get <agent_id>\n"
            << "  foremanctl <addr> stats <agent_id>\n"
            << "  foremanctl <addr> outputs <agent_id> [limit]\n"
            << "  foremanctl <addr> runs [status=running|completed|stopped|crashed|waiting_input] [limit]\n"
            << "  foremanctl <addr> run <agent_id>\n"
            << "  foremanctl <addr> prompts <agent_id>\n"
            << "  foremanctl <addr> resumable\n"
            << "  foremanctl <addr> run-stats\n"
            << "  foremanctl <addr> cleanup <days>\n"
            << "  foremanctl <addr> pipeline start <working_dir> <request> [max_iterations]\n"
            << "  foremanctl <addr> pipeline get <pipeline_id>\n"
            << "  foremanctl <addr> pipeline list\n"
            << "  foremanctl <addr> pipeline cancel <pipeline_id>\n"
            << "  foremanctl <addr> watch [name ...]\n";
}

static void PrintJson(const google::protobuf::Message& message) {
  std::string                            out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  const auto status      = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    std::cerr << "cannot render response: " << status.ToString() << "\n";
    return;
  }
  std::cout << out;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static std::optional<RunStatus> ParseRunStatus(const std::string& value) {
  if (value == "running") return RUN_STATUS_RUNNING;
  if (value == "completed") return RUN_STATUS_COMPLETED;
  if (value == "stopped") return RUN_STATUS_STOPPED;
  if (value == "crashed") return RUN_STATUS_CRASHED;
  if (value == "waiting_input") return RUN_STATUS_WAITING_INPUT;
  return std::nullopt;
}

static AgentRef MakeAgentRef(const std::string& agent_id) {
  AgentRef ref;
  ref.set_agent_id(agent_id);
  return ref;
}

static int RunPipelineCommand(PipelineService::Stub& stub, int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  const std::string   sub = argv[3];
  grpc::ClientContext ctx;
  Pipeline            pipeline;

  if (sub == "start") {
    if (argc < 6) return 1;

    StartPipelineRequest req;
    req.set_working_dir(argv[4]);
    req.set_user_request(argv[5]);
    req.set_max_iterations(argc >= 7 ? static_cast<uint32_t>(std::stoul(argv[6])) : 0);

    auto status = stub.StartPipeline(&ctx, req, &pipeline);
    if (!status.ok()) return Fail(status);

    std::cout << "pipeline=" << pipeline.id() << "\n";
    return 0;
  }

  if (sub == "get" || sub == "cancel") {
    if (argc < 5) return 1;

    PipelineRef ref;
    ref.set_pipeline_id(argv[4]);

    auto status = sub == "get" ? stub.GetPipeline(&ctx, ref, &pipeline) : stub.CancelPipeline(&ctx, ref, &pipeline);
    if (!status.ok()) return Fail(status);

    PrintJson(pipeline);
    return 0;
  }

  if (sub == "list") {
    ListPipelinesResponse resp;
    auto                  status = stub.ListPipelines(&ctx, google::protobuf::Empty{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& p : resp.pipelines()) {
      std::cout << p.id() << " " << p.status() << " " << p.phase() << " iteration=" << p.current_iteration() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto agent_stub    = AgentService::NewStub(channel);
  auto run_stub      = RunService::NewStub(channel);
  auto pipeline_stub = PipelineService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "spawn") {
    if (argc < 4) return 1;

    SpawnAgentRequest req;
    req.set_working_dir(argv[3]);
    if (argc >= 5) req.set_model(argv[4]);
    if (argc >= 6) req.set_initial_prompt(argv[5]);

    SpawnAgentResponse resp;

    auto status = agent_stub->SpawnAgent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "agent=" << resp.agent().agent_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    if (argc < 4) return 1;

    google::protobuf::Empty resp;

    auto status = agent_stub->StopAgent(&ctx, MakeAgentRef(argv[3]), &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "stopped\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "send") {
    if (argc < 5) return 1;

    SendInputRequest req;
    req.set_agent_id(argv[3]);
    req.set_text(argv[4]);

    google::protobuf::Empty resp;

    auto status = agent_stub->SendInput(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "sent\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListAgentsResponse resp;

    auto status = agent_stub->ListAgents(&ctx, google::protobuf::Empty{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& agent : resp.agents()) {
      std::cout << agent.agent_id() << " " << AgentStatus_Name(agent.status()) << " " << agent.working_dir() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    AgentInfo resp;

    auto status = agent_stub->GetAgent(&ctx, MakeAgentRef(argv[3]), &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    if (argc < 4) return 1;

    GetStatisticsResponse resp;

    auto status = agent_stub->GetStatistics(&ctx, MakeAgentRef(argv[3]), &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp.stats());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "outputs") {
    if (argc < 4) return 1;

    GetOutputsRequest req;
    req.set_agent_id(argv[3]);
    req.set_limit(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 0);

    GetOutputsResponse resp;

    auto status = agent_stub->GetOutputs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << "[" << event.output_type() << "] " << event.content() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "runs") {
    RunQuery req;
    if (argc >= 4) {
      auto parsed = ParseRunStatus(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(parsed.value());
    }
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    QueryRunsResponse resp;

    auto status = run_stub->QueryRuns(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& run : resp.runs()) {
      std::cout << run.agent_id() << " " << RunStatus_Name(run.status()) << " " << run.source() << " " << run.working_dir() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    if (argc < 4) return 1;

    RunRecord resp;

    auto status = run_stub->GetRun(&ctx, MakeAgentRef(argv[3]), &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "prompts") {
    if (argc < 4) return 1;

    GetPromptsResponse resp;

    auto status = run_stub->GetPrompts(&ctx, MakeAgentRef(argv[3]), &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& prompt : resp.prompts()) {
      std::cout << prompt.timestamp_ms() << " " << prompt.prompt() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resumable") {
    QueryRunsResponse resp;

    auto status = run_stub->GetResumableRuns(&ctx, google::protobuf::Empty{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& run : resp.runs()) {
      std::cout << run.agent_id() << " session=" << run.session_id() << " " << run.working_dir() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run-stats") {
    RunStats resp;

    auto status = run_stub->GetRunStats(&ctx, google::protobuf::Empty{}, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    if (argc < 4) return 1;

    CleanupOldRunsRequest req;
    req.set_days(static_cast<uint32_t>(std::stoul(argv[3])));

    CleanupOldRunsResponse resp;

    auto status = run_stub->CleanupOldRuns(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted=" << resp.deleted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pipeline") {
    return RunPipelineCommand(*pipeline_stub, argc, argv);
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    SubscribeRequest req;
    for (int i = 3; i < argc; ++i) {
      req.add_names(argv[i]);
    }

    auto         reader = agent_stub->Subscribe(&ctx, req);
    Notification notification;
    while (reader->Read(&notification)) {
      std::string                              payload;
      google::protobuf::util::JsonPrintOptions options;
      if (!google::protobuf::util::MessageToJsonString(notification.payload(), &payload, options).ok()) {
        payload = "{}";
      }
      std::cout << notification.timestamp_ms() << " " << notification.name() << " " << payload << std::endl;
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
