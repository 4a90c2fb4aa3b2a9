#pragma once

#include "foreman/v1/foreman_service.pb.h"
#include "service_context.hpp"

namespace foreman::service {

class PipelineService {
 public:
  explicit PipelineService(ServiceContext ctx);

  foreman::v1::Pipeline              StartPipeline(const foreman::v1::StartPipelineRequest& req);
  foreman::v1::Pipeline              GetPipeline(const foreman::v1::PipelineRef& req);
  foreman::v1::ListPipelinesResponse ListPipelines();
  foreman::v1::Pipeline              CancelPipeline(const foreman::v1::PipelineRef& req);

 private:
  foreman::v1::Pipeline Snapshot(const std::string& pipeline_id) const;

  ServiceContext ctx_;
};

} // namespace foreman::service
