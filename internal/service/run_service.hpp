#pragma once

#include "foreman/v1/foreman_service.pb.h"
#include "internal/db/model/run_record.hpp"
#include "service_context.hpp"

namespace foreman::service {

class RunService {
 public:
  explicit RunService(ServiceContext ctx);

  foreman::v1::RunRecord              GetRun(const foreman::v1::AgentRef& req);
  foreman::v1::QueryRunsResponse      QueryRuns(const foreman::v1::RunQuery& req);
  foreman::v1::QueryRunsResponse      GetResumableRuns();
  foreman::v1::GetPromptsResponse     GetPrompts(const foreman::v1::AgentRef& req);
  foreman::v1::RunStats               GetRunStats();
  foreman::v1::CleanupOldRunsResponse CleanupOldRuns(const foreman::v1::CleanupOldRunsRequest& req);

 private:
  ServiceContext ctx_;
};

foreman::v1::RunRecord   ToProto(const foreman::db::model::RunRecord& record);
foreman::db::model::RunQuery FromProto(const foreman::v1::RunQuery& query);

} // namespace foreman::service
