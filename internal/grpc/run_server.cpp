#include "run_server.hpp"

#include "foreman/v1.hpp"
#include "grpc_error.hpp"

namespace foreman::grpc {

RunServer::RunServer(std::shared_ptr<foreman::service::RunService> svc) : service_(std::move(svc)) {
}

::grpc::Status RunServer::GetRun(::grpc::ServerContext*, const foreman::v1::AgentRef* req, foreman::v1::RunRecord* resp) {
  try {
    *resp = service_->GetRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RunServer::QueryRuns(::grpc::ServerContext*, const foreman::v1::RunQuery* req, foreman::v1::QueryRunsResponse* resp) {
  try {
    *resp = service_->QueryRuns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RunServer::GetResumableRuns(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::QueryRunsResponse* resp) {
  try {
    *resp = service_->GetResumableRuns();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RunServer::GetPrompts(::grpc::ServerContext*, const foreman::v1::AgentRef* req, foreman::v1::GetPromptsResponse* resp) {
  try {
    *resp = service_->GetPrompts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RunServer::GetRunStats(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::RunStats* resp) {
  try {
    *resp = service_->GetRunStats();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RunServer::CleanupOldRuns(::grpc::ServerContext*, const foreman::v1::CleanupOldRunsRequest* req,
                                         foreman::v1::CleanupOldRunsResponse* resp) {
  try {
    *resp = service_->CleanupOldRuns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace foreman::grpc
