#include "agent_service.hpp"

#include "internal/supervisor/agent_supervisor.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace foreman::service {

using namespace foreman::v1;

namespace {

void RequireAgentId(const std::string& agent_id) {
  if (agent_id.empty()) {
    throw util::InvalidState("agent_id is required");
  }
}

} // namespace

AgentService::AgentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SpawnAgentResponse AgentService::SpawnAgent(const SpawnAgentRequest& req) {
  return ObserveRpc("AgentService.SpawnAgent", "working_dir", req.working_dir(), [&] {
    supervisor::SpawnOptions options;
    options.working_dir = req.working_dir();
    options.model       = req.model();

    const auto agent_id = ctx_.supervisor->Spawn(options);
    if (!req.initial_prompt().empty()) {
      ctx_.supervisor->SendInput(agent_id, req.initial_prompt());
    }

    SpawnAgentResponse resp;
    if (auto info = ctx_.supervisor->GetInfo(agent_id)) {
      *resp.mutable_agent() = *info;
    } else {
      resp.mutable_agent()->set_agent_id(agent_id);
    }
    return resp;
  });
}

void AgentService::StopAgent(const AgentRef& req) {
  ObserveRpc("AgentService.StopAgent", "agent_id", req.agent_id(), [&] {
    RequireAgentId(req.agent_id());
    ctx_.supervisor->Stop(req.agent_id());
  });
}

void AgentService::SendInput(const SendInputRequest& req) {
  ObserveRpc("AgentService.SendInput", "agent_id", req.agent_id(), [&] {
    RequireAgentId(req.agent_id());
    if (req.text().empty()) {
      throw util::InvalidState("text is required");
    }
    ctx_.supervisor->SendInput(req.agent_id(), req.text());
  });
}

ListAgentsResponse AgentService::ListAgents() {
  return ObserveRpc("AgentService.ListAgents", [&] {
    ListAgentsResponse resp;
    for (auto& info : ctx_.supervisor->List()) {
      *resp.add_agents() = std::move(info);
    }
    return resp;
  });
}

AgentInfo AgentService::GetAgent(const AgentRef& req) {
  return ObserveRpc("AgentService.GetAgent", "agent_id", req.agent_id(), [&] {
    auto info = ctx_.supervisor->GetInfo(req.agent_id());
    if (!info) {
      throw util::NotFound("Agent not found: " + req.agent_id());
    }
    return *info;
  });
}

GetStatisticsResponse AgentService::GetStatistics(const AgentRef& req) {
  return ObserveRpc("AgentService.GetStatistics", "agent_id", req.agent_id(), [&] {
    GetStatisticsResponse resp;
    resp.set_agent_id(req.agent_id());
    *resp.mutable_stats() = ctx_.supervisor->GetStatistics(req.agent_id()).ToProto();
    return resp;
  });
}

GetOutputsResponse AgentService::GetOutputs(const GetOutputsRequest& req) {
  return ObserveRpc("AgentService.GetOutputs", "agent_id", req.agent_id(), [&] {
    GetOutputsResponse resp;
    for (auto& event : ctx_.supervisor->GetOutputs(req.agent_id(), req.limit())) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

std::shared_ptr<events::Subscription> AgentService::Subscribe(const SubscribeRequest& req) {
  return ObserveRpc("AgentService.Subscribe", [&] {
    std::vector<std::string> names(req.names().begin(), req.names().end());
    return ctx_.events->Subscribe(std::move(names));
  });
}

void AgentService::Unsubscribe(const std::shared_ptr<events::Subscription>& subscription) {
  ctx_.events->Unsubscribe(subscription);
}

} // namespace foreman::service
