#include "pipeline_service.hpp"

#include <filesystem>

#include "internal/pipeline/pipeline_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace foreman::service {

using namespace foreman::v1;

PipelineService::PipelineService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

foreman::v1::Pipeline PipelineService::StartPipeline(const StartPipelineRequest& req) {
  return ObserveRpc("PipelineService.StartPipeline", "working_dir", req.working_dir(), [&] {
    if (req.user_request().empty()) {
      throw util::InvalidState("user_request is required");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(req.working_dir(), ec)) {
      throw util::InvalidState("Working directory does not exist: " + req.working_dir());
    }
    const auto id = ctx_.pipelines->Submit(req.user_request(), req.working_dir(), req.max_iterations());
    return Snapshot(id);
  });
}

foreman::v1::Pipeline PipelineService::GetPipeline(const PipelineRef& req) {
  return ObserveRpc("PipelineService.GetPipeline", "pipeline_id", req.pipeline_id(), [&] { return Snapshot(req.pipeline_id()); });
}

ListPipelinesResponse PipelineService::ListPipelines() {
  return ObserveRpc("PipelineService.ListPipelines", [&] {
    ListPipelinesResponse resp;
    for (const auto& pipeline : ctx_.pipelines->List()) {
      *resp.add_pipelines() = pipeline.ToProto();
    }
    return resp;
  });
}

foreman::v1::Pipeline PipelineService::CancelPipeline(const PipelineRef& req) {
  return ObserveRpc("PipelineService.CancelPipeline", "pipeline_id", req.pipeline_id(), [&] {
    ctx_.pipelines->Cancel(req.pipeline_id());
    return Snapshot(req.pipeline_id());
  });
}

foreman::v1::Pipeline PipelineService::Snapshot(const std::string& pipeline_id) const {
  auto pipeline = ctx_.pipelines->Get(pipeline_id);
  if (!pipeline) {
    throw util::NotFound("Pipeline not found: " + pipeline_id);
  }
  return pipeline->ToProto();
}

} // namespace foreman::service
