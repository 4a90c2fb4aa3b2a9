#include "agent_server.hpp"

#include <chrono>

#include "foreman/v1.hpp"
#include "grpc_error.hpp"

namespace foreman::grpc {

using namespace std::chrono_literals;

AgentServer::AgentServer(std::shared_ptr<foreman::service::AgentService> svc) : service_(std::move(svc)) {
}

::grpc::Status AgentServer::SpawnAgent(::grpc::ServerContext*, const foreman::v1::SpawnAgentRequest* req, foreman::v1::SpawnAgentResponse* resp) {
  try {
    *resp = service_->SpawnAgent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::StopAgent(::grpc::ServerContext*, const foreman::v1::AgentRef* req, google::protobuf::Empty*) {
  try {
    service_->StopAgent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::SendInput(::grpc::ServerContext*, const foreman::v1::SendInputRequest* req, google::protobuf::Empty*) {
  try {
    service_->SendInput(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::ListAgents(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::ListAgentsResponse* resp) {
  try {
    *resp = service_->ListAgents();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::GetAgent(::grpc::ServerContext*, const foreman::v1::AgentRef* req, foreman::v1::AgentInfo* resp) {
  try {
    *resp = service_->GetAgent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::GetStatistics(::grpc::ServerContext*, const foreman::v1::AgentRef* req, foreman::v1::GetStatisticsResponse* resp) {
  try {
    *resp = service_->GetStatistics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::GetOutputs(::grpc::ServerContext*, const foreman::v1::GetOutputsRequest* req, foreman::v1::GetOutputsResponse* resp) {
  try {
    *resp = service_->GetOutputs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::Subscribe(::grpc::ServerContext* ctx, const foreman::v1::SubscribeRequest* req,
                                      ::grpc::ServerWriter<foreman::v1::Notification>* writer) {
  std::shared_ptr<foreman::events::Subscription> subscription;
  try {
    subscription = service_->Subscribe(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  // poll so a vanished client is noticed even when nothing is emitted
  while (!ctx->IsCancelled()) {
    auto notification = subscription->Next(250ms);
    if (!notification) {
      if (subscription->Closed()) {
        break;
      }
      continue;
    }
    if (!writer->Write(*notification)) {
      break;
    }
  }

  service_->Unsubscribe(subscription);
  return ::grpc::Status::OK;
}

} // namespace foreman::grpc
