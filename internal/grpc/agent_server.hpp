#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "foreman/v1/foreman_service.grpc.pb.h"
#include "internal/service/agent_service.hpp"

namespace foreman::grpc {

class AgentServer final : public foreman::v1::AgentService::Service {
 public:
  explicit AgentServer(std::shared_ptr<foreman::service::AgentService> svc);

  ::grpc::Status SpawnAgent(::grpc::ServerContext*, const foreman::v1::SpawnAgentRequest*, foreman::v1::SpawnAgentResponse*) override;
  ::grpc::Status StopAgent(::grpc::ServerContext*, const foreman::v1::AgentRef*, google::protobuf::Empty*) override;
  ::grpc::Status SendInput(::grpc::ServerContext*, const foreman::v1::SendInputRequest*, google::protobuf::Empty*) override;
  ::grpc::Status ListAgents(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::ListAgentsResponse*) override;
  ::grpc::Status GetAgent(::grpc::ServerContext*, const foreman::v1::AgentRef*, foreman::v1::AgentInfo*) override;
  ::grpc::Status GetStatistics(::grpc::ServerContext*, const foreman::v1::AgentRef*, foreman::v1::GetStatisticsResponse*) override;
  ::grpc::Status GetOutputs(::grpc::ServerContext*, const foreman::v1::GetOutputsRequest*, foreman::v1::GetOutputsResponse*) override;

  // Streams notifications until the client goes away or the bus closes.
  ::grpc::Status Subscribe(::grpc::ServerContext*, const foreman::v1::SubscribeRequest*,
                           ::grpc::ServerWriter<foreman::v1::Notification>*) override;

 private:
  std::shared_ptr<foreman::service::AgentService> service_;
};

} // namespace foreman::grpc
