#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace foreman::events {
class EventBus;
}
namespace foreman::persistence {
class PersistenceQueue;
class PersistenceWorker;
}
namespace foreman::pipeline {
class PipelineManager;
}
namespace foreman::runs {
class RunStore;
}
namespace foreman::supervisor {
class AgentSupervisor;
}

namespace foreman::factory {

/*
  Application

  Owns every long-lived component of the daemon. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<runs::RunStore>                  runs;
  std::shared_ptr<events::EventBus>                events;
  std::shared_ptr<persistence::PersistenceQueue>   persistence_queue;
  std::shared_ptr<persistence::PersistenceWorker>  persistence_worker;
  std::shared_ptr<supervisor::AgentSupervisor>     supervisor;
  std::shared_ptr<pipeline::PipelineManager>       pipelines;

  /*
    Stops pipelines, then workers, then drains queued history writes and
    closes notification streams. Safe to call more than once.
  */
  void Shutdown();
};

/*
  Build

  Constructs the whole daemon from the runtime config and reconciles runs a
  previous process left live.

  This is the composition root of the application: the only place that
  knows concrete repository and launcher types.
*/
Application Build(const foreman::runtime::config::RuntimeConfig& config);

} // namespace foreman::factory
