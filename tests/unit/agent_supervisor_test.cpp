#include "internal/supervisor/agent_supervisor.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/persistence/persistence_worker.hpp"
#include "internal/supervisor/posix_process_launcher.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using foreman::supervisor::AgentSupervisor;
using foreman::supervisor::SpawnOptions;

// Answers every input line with one text message and a successful result.
constexpr const char* kEchoWorker = R"(#!/bin/sh
n=0
while IFS= read -r line; do
  n=$((n+1))
  if [ "$n" -eq 1 ]; then
    echo '{"type":"system","subtype":"init","session_id":"sess-'"$$"'","model":"test-model","tools":["Bash"]}'
  fi
  echo "not json, just noise"
  echo '{"type":"assistant","message":{"content":[{"type":"text","text":"Done"}]}}'
  echo '{"type":"result","subtype":"success","result":"Done","total_cost_usd":0.01,"num_turns":1,"usage":{"input_tokens":3,"output_tokens":2}}'
done
)";

// Starts the turn, complains on stderr, then dies.
constexpr const char* kCrashingWorker = R"(#!/bin/sh
read -r line
echo '{"type":"assistant","message":{"content":[{"type":"text","text":"working"}]}}'
echo "fatal: out of memory" >&2
exit 3
)";

// Answers every input line with a failed result and stays alive.
constexpr const char* kFailingTurnWorker = R"(#!/bin/sh
while IFS= read -r line; do
  echo '{"type":"assistant","message":{"content":[{"type":"text","text":"trying"}]}}'
  echo '{"type":"result","subtype":"error_during_execution"}'
done
)";

// One turn in three stages, each released by a file the test creates in the working dir.
constexpr const char* kGatedWorker = R"(#!/bin/sh
IFS= read -r line
echo '{"type":"assistant","message":{"content":[{"type":"tool_use","name":"Bash","input":{"command":"ls"}}]}}'
while [ ! -f step-2 ]; do sleep 0.02; done
echo '{"type":"assistant","message":{"content":[{"type":"text","text":"Done"}],"stop_reason":"end_turn"}}'
while [ ! -f step-3 ]; do sleep 0.02; done
echo "progress: 100%"
while IFS= read -r line; do :; done
)";

struct Harness {
  fs::path                                                   dir;
  std::shared_ptr<foreman::runs::RunStore>                   runs;
  std::shared_ptr<foreman::persistence::PersistenceQueue>    queue;
  std::unique_ptr<foreman::persistence::PersistenceWorker>   writer;
  std::shared_ptr<foreman::events::EventBus>                 events;
  std::unique_ptr<AgentSupervisor>                           supervisor;

  Harness(const std::string& name, const char* script) {
    dir = fs::temp_directory_path() / ("foreman_supervisor_test_" + name);
    fs::create_directories(dir);
    const auto script_path = dir / "worker.sh";
    {
      std::ofstream out(script_path);
      out << script;
    }
    fs::permissions(script_path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec, fs::perm_options::replace);

    foreman::runtime::config::WorkerConfig config;
    config.set_executable(script_path.string());
    config.set_output_buffer_size(50);
    config.set_stop_grace_ms(500);

    runs   = std::make_shared<foreman::runs::RunStore>(std::make_shared<foreman::db::memory::MemoryRepository>());
    queue  = std::make_shared<foreman::persistence::PersistenceQueue>();
    writer = std::make_unique<foreman::persistence::PersistenceWorker>(queue);
    writer->Start();
    events     = std::make_shared<foreman::events::EventBus>();
    supervisor = std::make_unique<AgentSupervisor>(config, std::make_shared<foreman::supervisor::PosixProcessLauncher>(), runs, queue, events);
  }

  ~Harness() {
    supervisor->Shutdown();
    writer->Stop();
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  std::string Spawn() {
    SpawnOptions options;
    options.working_dir = dir.string();
    return supervisor->Spawn(options);
  }

  void Release(const std::string& gate) {
    std::ofstream out(dir / gate);
  }

  bool WaitForOutput(const std::string& agent_id, const std::string& output_type) {
    for (int i = 0; i < 500; ++i) {
      for (const auto& event : supervisor->GetOutputs(agent_id)) {
        if (event.output_type() == output_type) return true;
      }
      std::this_thread::sleep_for(10ms);
    }
    return false;
  }

  void WaitUntilRetired() {
    for (int i = 0; i < 200 && supervisor->LiveCount() > 0; ++i) {
      std::this_thread::sleep_for(10ms);
    }
    assert(supervisor->LiveCount() == 0);
    queue->WaitUntilIdle();
  }
};

void TestTurnEndsWaitingForInput() {
  Harness    h("turn", kEchoWorker);
  auto       sub      = h.events->Subscribe({"agent:input_required"});
  const auto agent_id = h.Spawn();

  auto info = h.supervisor->GetInfo(agent_id);
  assert(info.has_value());
  assert(info->status() == foreman::v1::AGENT_STATUS_IDLE);

  h.supervisor->SendInput(agent_id, "say done");
  assert(h.supervisor->WaitForIdle(agent_id, 10s) == foreman::v1::AGENT_STATUS_WAITING_FOR_INPUT);

  info = h.supervisor->GetInfo(agent_id);
  assert(info->pending_input());
  assert(!info->is_processing());
  assert(info->session_id().rfind("sess-", 0) == 0);
  assert(h.supervisor->AgentForSession(info->session_id()) == agent_id);

  const auto stats = h.supervisor->GetStatistics(agent_id);
  assert(stats.total_prompts == 1);
  assert(stats.total_cost_usd == 0.01);
  assert(stats.total_tokens_used == 5u);

  bool saw_plain = false;
  bool saw_text  = false;
  for (const auto& event : h.supervisor->GetOutputs(agent_id)) {
    saw_plain = saw_plain || event.output_type() == "plain_text";
    saw_text  = saw_text || event.output_type() == "text";
  }
  assert(saw_plain && saw_text);
  assert(h.supervisor->GetOutputs(agent_id, 1).size() == 1);
  assert(h.supervisor->GetOutputs(agent_id, 1).front().output_type() == "result");

  const auto required = sub->Next(5s);
  assert(required.has_value());
  assert(required->payload().fields().at("last_output").string_value() == "Done");

  h.queue->WaitUntilIdle();
  const auto prompts = h.runs->Prompts(agent_id);
  assert(prompts.size() == 1);
  assert(prompts[0].prompt == "say done");
  const auto run = h.runs->Get(agent_id);
  assert(run->status == foreman::v1::RUN_STATUS_WAITING_INPUT);
  assert(run->initial_prompt == "say done");
}

void TestStopEndsRunAsStopped() {
  Harness    h("stop", kEchoWorker);
  const auto agent_id = h.Spawn();
  h.supervisor->SendInput(agent_id, "hello");
  (void)h.supervisor->WaitForIdle(agent_id, 10s);

  h.supervisor->Stop(agent_id);
  h.WaitUntilRetired();

  assert(h.supervisor->GetInfo(agent_id)->status() == foreman::v1::AGENT_STATUS_STOPPED);
  assert(h.supervisor->List().empty());
  assert(!h.supervisor->GetOutputs(agent_id).empty());

  const auto run = h.runs->Get(agent_id);
  assert(run->status == foreman::v1::RUN_STATUS_STOPPED);
  assert(run->ended_at_ms > 0);

  // stopping again is harmless, input is not
  h.supervisor->Stop(agent_id);
  bool threw = false;
  try {
    h.supervisor->SendInput(agent_id, "again");
  } catch (const foreman::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestCrashIsRecordedAsResumable() {
  Harness    h("crash", kCrashingWorker);
  const auto agent_id = h.Spawn();
  h.supervisor->SendInput(agent_id, "go");

  assert(h.supervisor->WaitForIdle(agent_id, 10s) == foreman::v1::AGENT_STATUS_ERROR);
  h.WaitUntilRetired();

  bool saw_stderr = false;
  for (const auto& event : h.supervisor->GetOutputs(agent_id)) {
    saw_stderr = saw_stderr || (event.output_type() == "error" && event.content() == "fatal: out of memory");
  }
  assert(saw_stderr);

  const auto run = h.runs->Get(agent_id);
  assert(run->status == foreman::v1::RUN_STATUS_CRASHED);
  assert(run->can_resume);
  assert(run->error_message == "Process terminated unexpectedly");
  assert(h.runs->Resumable().size() == 1);
}

void TestFlagsFollowEachLineOfATurn() {
  Harness    h("gated", kGatedWorker);
  auto       sub      = h.events->Subscribe({"agent:input_required"});
  const auto agent_id = h.Spawn();
  h.supervisor->SendInput(agent_id, "go");

  // tool use keeps the worker busy
  assert(h.WaitForOutput(agent_id, "tool_use"));
  auto info = h.supervisor->GetInfo(agent_id);
  assert(info->status() == foreman::v1::AGENT_STATUS_PROCESSING);
  assert(info->is_processing());
  assert(!info->pending_input());
  assert(h.supervisor->GetStatistics(agent_id).total_tool_calls == 1);
  assert(!sub->Next(50ms).has_value());

  // end_turn text without a result settles the turn
  h.Release("step-2");
  assert(h.supervisor->WaitForIdle(agent_id, 10s) == foreman::v1::AGENT_STATUS_WAITING_FOR_INPUT);
  info = h.supervisor->GetInfo(agent_id);
  assert(info->pending_input());
  assert(!info->is_processing());
  const auto required = sub->Next(5s);
  assert(required.has_value());
  assert(required->payload().fields().at("last_output").string_value() == "Done");

  // plain text afterwards changes nothing
  h.Release("step-3");
  assert(h.WaitForOutput(agent_id, "plain_text"));
  info = h.supervisor->GetInfo(agent_id);
  assert(info->status() == foreman::v1::AGENT_STATUS_WAITING_FOR_INPUT);
  assert(info->pending_input());
  assert(!info->is_processing());
  assert(h.supervisor->GetStatistics(agent_id).total_tool_calls == 1);
}

void TestFailedTurnDoesNotAskForInput() {
  Harness    h("failed_turn", kFailingTurnWorker);
  auto       sub      = h.events->Subscribe({"agent:input_required"});
  const auto agent_id = h.Spawn();
  h.supervisor->SendInput(agent_id, "go");

  // WaitForIdle wakes on the failed result without the worker settling
  assert(h.supervisor->WaitForIdle(agent_id, 10s) == foreman::v1::AGENT_STATUS_PROCESSING);
  assert(h.supervisor->LastTurnFailed(agent_id));

  const auto info = h.supervisor->GetInfo(agent_id);
  assert(info->status() == foreman::v1::AGENT_STATUS_PROCESSING);
  assert(info->is_processing());
  assert(!info->pending_input());
  assert(!sub->Next(300ms).has_value());

  bool saw_result = false;
  for (const auto& event : h.supervisor->GetOutputs(agent_id)) {
    saw_result = saw_result || event.output_type() == "result";
  }
  assert(saw_result);
}

void TestStopAfterCrashKeepsError() {
  Harness h("stop_after_crash", kCrashingWorker);
  auto    statuses = h.events->Subscribe({"agent:status"});

  std::vector<std::string> agents;
  for (int i = 0; i < 10; ++i) {
    const auto agent_id = h.Spawn();
    h.supervisor->SendInput(agent_id, "go");
    assert(h.supervisor->WaitForIdle(agent_id, 10s) == foreman::v1::AGENT_STATUS_ERROR);

    // what a pipeline does when it releases a failed step's worker
    h.supervisor->Stop(agent_id);
    assert(h.supervisor->GetInfo(agent_id)->status() == foreman::v1::AGENT_STATUS_ERROR);
    agents.push_back(agent_id);
  }
  h.WaitUntilRetired();

  for (const auto& agent_id : agents) {
    assert(h.supervisor->GetInfo(agent_id)->status() == foreman::v1::AGENT_STATUS_ERROR);
    const auto run = h.runs->Get(agent_id);
    assert(run->status == foreman::v1::RUN_STATUS_CRASHED);
    assert(run->can_resume);
  }
  while (auto notification = statuses->Next(50ms)) {
    assert(notification->payload().fields().at("status").string_value() != "stopped");
  }
}

void TestSpawnFailures() {
  Harness h("spawn_failures", kEchoWorker);

  SpawnOptions missing_dir;
  missing_dir.working_dir = (h.dir / "does-not-exist").string();
  bool threw              = false;
  try {
    (void)h.supervisor->Spawn(missing_dir);
  } catch (const foreman::util::SpawnError&) {
    threw = true;
  }
  assert(threw);

  bool not_found = false;
  try {
    h.supervisor->SendInput("no-such-agent", "hi");
  } catch (const foreman::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  foreman::runtime::config::WorkerConfig config;
  config.set_executable((h.dir / "no-such-binary").string());
  AgentSupervisor broken(config, std::make_shared<foreman::supervisor::PosixProcessLauncher>(), nullptr, nullptr, nullptr);
  SpawnOptions    options;
  options.working_dir = h.dir.string();
  threw               = false;
  try {
    (void)broken.Spawn(options);
  } catch (const foreman::util::SpawnError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  ::unsetenv("CLAUDE_PATH");
  ::unsetenv("CLAUDE_CODE_MODEL");

  TestTurnEndsWaitingForInput();
  TestStopEndsRunAsStopped();
  TestCrashIsRecordedAsResumable();
  TestFlagsFollowEachLineOfATurn();
  TestFailedTurnDoesNotAskForInput();
  TestStopAfterCrashKeepsError();
  TestSpawnFailures();

  std::cout << "foreman_unit_agent_supervisor: pass\n";
  return 0;
}
