#pragma once

#include <memory>

#include "foreman/v1/foreman_service.pb.h"
#include "internal/events/event_bus.hpp"
#include "service_context.hpp"

namespace foreman::service {

class AgentService {
 public:
  explicit AgentService(ServiceContext ctx);

  foreman::v1::SpawnAgentResponse SpawnAgent(const foreman::v1::SpawnAgentRequest& req);

  void StopAgent(const foreman::v1::AgentRef& req);
  void SendInput(const foreman::v1::SendInputRequest& req);

  foreman::v1::ListAgentsResponse    ListAgents();
  foreman::v1::AgentInfo             GetAgent(const foreman::v1::AgentRef& req);
  foreman::v1::GetStatisticsResponse GetStatistics(const foreman::v1::AgentRef& req);
  foreman::v1::GetOutputsResponse    GetOutputs(const foreman::v1::GetOutputsRequest& req);

  // Caller drains the subscription and must hand it back to Unsubscribe.
  std::shared_ptr<foreman::events::Subscription> Subscribe(const foreman::v1::SubscribeRequest& req);
  void                                           Unsubscribe(const std::shared_ptr<foreman::events::Subscription>& subscription);

 private:
  ServiceContext ctx_;
};

} // namespace foreman::service
