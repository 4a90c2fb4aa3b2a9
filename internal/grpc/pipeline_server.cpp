#include "pipeline_server.hpp"

#include "foreman/v1.hpp"
#include "grpc_error.hpp"

namespace foreman::grpc {

PipelineServer::PipelineServer(std::shared_ptr<foreman::service::PipelineService> svc) : service_(std::move(svc)) {
}

::grpc::Status PipelineServer::StartPipeline(::grpc::ServerContext*, const foreman::v1::StartPipelineRequest* req, foreman::v1::Pipeline* resp) {
  try {
    *resp = service_->StartPipeline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::GetPipeline(::grpc::ServerContext*, const foreman::v1::PipelineRef* req, foreman::v1::Pipeline* resp) {
  try {
    *resp = service_->GetPipeline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::ListPipelines(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::ListPipelinesResponse* resp) {
  try {
    *resp = service_->ListPipelines();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::CancelPipeline(::grpc::ServerContext*, const foreman::v1::PipelineRef* req, foreman::v1::Pipeline* resp) {
  try {
    *resp = service_->CancelPipeline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace foreman::grpc
