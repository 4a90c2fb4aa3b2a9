#pragma once

#include <memory>

namespace foreman::supervisor {
class AgentSupervisor;
}
namespace foreman::runs {
class RunStore;
}
namespace foreman::pipeline {
class PipelineManager;
}
namespace foreman::events {
class EventBus;
}

namespace foreman::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<foreman::supervisor::AgentSupervisor> supervisor;
  std::shared_ptr<foreman::runs::RunStore>              runs;
  std::shared_ptr<foreman::pipeline::PipelineManager>   pipelines;
  std::shared_ptr<foreman::events::EventBus>            events;
};

} // namespace foreman::service
