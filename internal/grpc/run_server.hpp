#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "foreman/v1/foreman_service.grpc.pb.h"
#include "internal/service/run_service.hpp"

namespace foreman::grpc {

class RunServer final : public foreman::v1::RunService::Service {
 public:
  explicit RunServer(std::shared_ptr<foreman::service::RunService> svc);

  ::grpc::Status GetRun(::grpc::ServerContext*, const foreman::v1::AgentRef*, foreman::v1::RunRecord*) override;
  ::grpc::Status QueryRuns(::grpc::ServerContext*, const foreman::v1::RunQuery*, foreman::v1::QueryRunsResponse*) override;
  ::grpc::Status GetResumableRuns(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::QueryRunsResponse*) override;
  ::grpc::Status GetPrompts(::grpc::ServerContext*, const foreman::v1::AgentRef*, foreman::v1::GetPromptsResponse*) override;
  ::grpc::Status GetRunStats(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::RunStats*) override;
  ::grpc::Status CleanupOldRuns(::grpc::ServerContext*, const foreman::v1::CleanupOldRunsRequest*, foreman::v1::CleanupOldRunsResponse*) override;

 private:
  std::shared_ptr<foreman::service::RunService> service_;
};

} // namespace foreman::grpc
