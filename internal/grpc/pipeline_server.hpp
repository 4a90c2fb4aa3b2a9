#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "foreman/v1/foreman_service.grpc.pb.h"
#include "internal/service/pipeline_service.hpp"

namespace foreman::grpc {

class PipelineServer final : public foreman::v1::PipelineService::Service {
 public:
  explicit PipelineServer(std::shared_ptr<foreman::service::PipelineService> svc);

  ::grpc::Status StartPipeline(::grpc::ServerContext*, const foreman::v1::StartPipelineRequest*, foreman::v1::Pipeline*) override;
  ::grpc::Status GetPipeline(::grpc::ServerContext*, const foreman::v1::PipelineRef*, foreman::v1::Pipeline*) override;
  ::grpc::Status ListPipelines(::grpc::ServerContext*, const google::protobuf::Empty*, foreman::v1::ListPipelinesResponse*) override;
  ::grpc::Status CancelPipeline(::grpc::ServerContext*, const foreman::v1::PipelineRef*, foreman::v1::Pipeline*) override;

 private:
  std::shared_ptr<foreman::service::PipelineService> service_;
};

} // namespace foreman::grpc
