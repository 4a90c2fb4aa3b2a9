#include "internal/pipeline/pipeline_manager.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/events/event_bus.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using namespace std::chrono_literals;
using foreman::pipeline::PipelineManager;
using foreman::pipeline::PipelineOptions;
using foreman::pipeline::PipelineState;
using foreman::pipeline::StepExecutor;
using foreman::pipeline::StepRequest;
using foreman::pipeline::StepResult;
using foreman::pipeline::StepRole;

/*
  Answers steps from a script instead of running workers. Every call gets a
  fresh agent id; `block_role` makes that step wait until its agent is
  released.
*/
class ScriptedExecutor final : public StepExecutor {
 public:
  using Script = std::function<std::string(StepRole role, int call)>;

  explicit ScriptedExecutor(Script script) : script_(std::move(script)) {
  }

  StepResult Run(const StepRequest& request, const SpawnedCallback& on_spawned) override {
    std::string agent_id;
    int         call = 0;
    {
      std::lock_guard lock(mutex_);
      call     = static_cast<int>(requests_.size());
      agent_id = "agent-" + std::to_string(call);
      requests_.push_back(request);
    }
    on_spawned(agent_id);

    StepResult result;
    result.agent_id = agent_id;

    if (block_role_ && *block_role_ == request.role) {
      std::unique_lock lock(mutex_);
      released_cv_.wait(lock, [&] { return released_.count(agent_id) > 0; });
      result.error = "worker stopped before finishing the step";
      return result;
    }

    const auto text = script_(request.role, call);
    if (text == "<fail>") {
      result.error = "worker process terminated unexpectedly";
      return result;
    }
    result.ok                     = true;
    result.output.raw_text        = text;
    result.output.structured_data = foreman::util::ParseValue(foreman::util::ExtractJsonText(text));
    return result;
  }

  void Release(const std::string& agent_id) override {
    {
      std::lock_guard lock(mutex_);
      released_.insert(agent_id);
    }
    released_cv_.notify_all();
  }

  void BlockOn(StepRole role) {
    block_role_ = role;
  }

  std::vector<StepRequest> Requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::set<std::string> Released() const {
    std::lock_guard lock(mutex_);
    return released_;
  }

 private:
  Script                   script_;
  std::optional<StepRole>  block_role_;
  mutable std::mutex       mutex_;
  std::condition_variable  released_cv_;
  std::vector<StepRequest> requests_;
  std::set<std::string>    released_;
};

constexpr const char* kPlan = R"({"plan":["write README.md"],"questions":["Which license?"]})";

std::string Verdict(const std::string& decision) {
  return "Verification done.\n```json\n{\"decision\":\"" + decision +
         "\",\"reasoning\":\"checked\",\"issues_to_fix\":[\"missing section\"],\"suggestions\":[\"add usage\"]}\n```";
}

std::vector<StepRole> Roles(const ScriptedExecutor& executor) {
  std::vector<StepRole> roles;
  for (const auto& request : executor.Requests()) {
    roles.push_back(request.role);
  }
  return roles;
}

void TestCompletesOnFirstPass() {
  auto executor = std::make_shared<ScriptedExecutor>([](StepRole role, int) {
    if (role == StepRole::kPlanning) return std::string(kPlan);
    if (role == StepRole::kBuilding) return std::string("IMPLEMENTATION COMPLETE");
    return Verdict("complete");
  });
  auto events    = std::make_shared<foreman::events::EventBus>();
  auto completed = events->Subscribe({"auto_pipeline:completed"});
  auto steps     = events->Subscribe({"auto_pipeline:step_completed"});

  PipelineManager manager(executor, events, PipelineOptions{});
  const auto      id = manager.Submit("add a readme", "/tmp", 0);
  assert(manager.WaitForCompletion(id, 10s));

  const auto pipeline = manager.Get(id);
  assert(pipeline->status == "completed");
  assert(pipeline->machine.State() == PipelineState::kCompleted);
  assert(pipeline->max_iterations == 3);
  assert(pipeline->final_decision == "complete");
  assert(pipeline->questions.size() == 1);
  assert(pipeline->machine.History().front().to == PipelineState::kAnalyzingTask);

  assert((Roles(*executor) == std::vector<StepRole>{StepRole::kPlanning, StepRole::kBuilding, StepRole::kVerifying}));

  // each step stops the worker of the step before it
  const auto requests = executor->Requests();
  assert(requests[0].previous_agent_id.empty());
  assert(requests[1].previous_agent_id == "agent-0");
  assert(requests[2].previous_agent_id == "agent-1");
  assert(requests[1].prompt.find("Which license?") != std::string::npos);
  assert(executor->Released().count("agent-2") == 1);

  const auto done = completed->Next(1s);
  assert(done.has_value());
  assert(done->payload().fields().at("status").string_value() == "success");
  assert(done->payload().fields().at("decision").string_value() == "complete");

  int completed_steps = 0;
  while (steps->Next(10ms)) ++completed_steps;
  assert(completed_steps == 3);
}

void TestIterationLimitFailsPipeline() {
  auto executor = std::make_shared<ScriptedExecutor>([](StepRole role, int) {
    if (role == StepRole::kPlanning) return std::string(kPlan);
    if (role == StepRole::kBuilding) return std::string("IMPLEMENTATION COMPLETE");
    return Verdict("iterate");
  });
  PipelineManager manager(executor, nullptr, PipelineOptions{});
  const auto      id = manager.Submit("add a readme", "/tmp", 2);
  assert(manager.WaitForCompletion(id, 10s));

  const auto pipeline = manager.Get(id);
  assert(pipeline->status == "failed");
  assert(pipeline->machine.State() == PipelineState::kFailed);
  assert(pipeline->failure_reason == "max_iterations_reached");
  assert(pipeline->history.size() == 2);
  assert((Roles(*executor) ==
          std::vector<StepRole>{StepRole::kPlanning, StepRole::kBuilding, StepRole::kVerifying, StepRole::kBuilding, StepRole::kVerifying}));

  // the second build sees what the verifier asked for
  const auto requests = executor->Requests();
  assert(requests[3].prompt.find("missing section") != std::string::npos);
}

void TestReplanRunsPlanningAgain() {
  auto executor = std::make_shared<ScriptedExecutor>([](StepRole role, int call) {
    if (role == StepRole::kPlanning) return std::string(kPlan);
    if (role == StepRole::kBuilding) return std::string("IMPLEMENTATION COMPLETE build " + std::to_string(call));
    return Verdict(call < 3 ? "replan" : "complete");
  });
  PipelineOptions options;
  options.skip_skill_synthesis = true;
  PipelineManager manager(executor, nullptr, options);
  const auto      id = manager.Submit("add a readme", "/tmp", 0);
  assert(manager.WaitForCompletion(id, 10s));

  const auto pipeline = manager.Get(id);
  assert(pipeline->status == "completed");
  assert(pipeline->current_iteration == 2);
  assert(pipeline->machine.History().front().to == PipelineState::kPlanning);
  assert((Roles(*executor) == std::vector<StepRole>{StepRole::kPlanning, StepRole::kBuilding, StepRole::kVerifying, StepRole::kPlanning,
                                                    StepRole::kBuilding, StepRole::kVerifying}));
  assert(executor->Requests()[3].prompt.find("build 1") != std::string::npos);
}

void TestGiveUpFailsPipeline() {
  auto executor = std::make_shared<ScriptedExecutor>([](StepRole role, int) {
    if (role == StepRole::kVerifying) return Verdict("give_up");
    return std::string(kPlan);
  });
  PipelineManager manager(executor, nullptr, PipelineOptions{});
  const auto      id = manager.Submit("impossible task", "/tmp", 0);
  assert(manager.WaitForCompletion(id, 10s));

  const auto pipeline = manager.Get(id);
  assert(pipeline->status == "failed");
  assert(pipeline->machine.State() == PipelineState::kGaveUp);
  assert(pipeline->failure_reason == "checked");
}

void TestStepFailureFailsPipeline() {
  auto executor = std::make_shared<ScriptedExecutor>([](StepRole role, int) {
    if (role == StepRole::kBuilding) return std::string("<fail>");
    return std::string(kPlan);
  });
  auto            events    = std::make_shared<foreman::events::EventBus>();
  auto            completed = events->Subscribe({"auto_pipeline:completed"});
  PipelineManager manager(executor, events, PipelineOptions{});
  const auto      id = manager.Submit("add a readme", "/tmp", 0);
  assert(manager.WaitForCompletion(id, 10s));

  const auto pipeline = manager.Get(id);
  assert(pipeline->status == "failed");
  assert(pipeline->machine.State() == PipelineState::kFailed);
  assert(pipeline->failure_reason.find("building step failed") == 0);
  assert(pipeline->Step(StepRole::kBuilding).status == foreman::pipeline::StepStatus::kFailed);
  assert(pipeline->Step(StepRole::kVerifying).status == foreman::pipeline::StepStatus::kPending);
  assert(executor->Requests().size() == 2);

  const auto done = completed->Next(1s);
  assert(done->payload().fields().at("status").string_value() == "failed");
}

void TestCancelStopsRunningStep() {
  auto executor = std::make_shared<ScriptedExecutor>([](StepRole, int) { return std::string(kPlan); });
  executor->BlockOn(StepRole::kBuilding);
  auto            events    = std::make_shared<foreman::events::EventBus>();
  auto            completed = events->Subscribe({"auto_pipeline:completed"});
  PipelineManager manager(executor, events, PipelineOptions{});
  const auto      id = manager.Submit("add a readme", "/tmp", 0);

  for (int i = 0; i < 500 && executor->Requests().size() < 2; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  assert(executor->Requests().size() == 2);

  manager.Cancel(id);
  assert(manager.WaitForCompletion(id, 10s));

  const auto pipeline = manager.Get(id);
  assert(pipeline->status == "failed");
  assert(pipeline->failure_reason == "cancelled");
  assert(executor->Released().count("agent-1") == 1);

  // announced exactly once
  assert(completed->Next(1s).has_value());
  assert(!completed->Next(50ms).has_value());

  bool threw = false;
  try {
    manager.Cancel(id);
  } catch (const foreman::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    manager.Cancel("no-such-pipeline");
  } catch (const foreman::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestShutdownRefusesNewWork() {
  auto executor = std::make_shared<ScriptedExecutor>([](StepRole, int) { return std::string(kPlan); });
  executor->BlockOn(StepRole::kPlanning);
  PipelineManager manager(executor, nullptr, PipelineOptions{});
  const auto      id = manager.Submit("add a readme", "/tmp", 0);
  manager.Shutdown();

  assert(manager.Get(id)->Finished());
  assert(manager.List().size() == 1);

  bool threw = false;
  try {
    (void)manager.Submit("more", "/tmp", 0);
  } catch (const foreman::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCompletesOnFirstPass();
  TestIterationLimitFailsPipeline();
  TestReplanRunsPlanningAgain();
  TestGiveUpFailsPipeline();
  TestStepFailureFailsPipeline();
  TestCancelStopsRunningStep();
  TestShutdownRefusesNewWork();

  std::cout << "foreman_unit_pipeline_manager: pass\n";
  return 0;
}
