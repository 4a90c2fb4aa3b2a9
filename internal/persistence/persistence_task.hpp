#pragma once

#include <functional>
#include <string>

#include "internal/db/api/result.hpp"

namespace foreman::persistence {

/*
  One best-effort history write.

  label names the write in logs ("output", "run_update", ...); tasks sharing
  an agent_id run in enqueue order; an empty agent_id is unordered.
*/
struct PersistenceTask {
  std::string                 label;
  std::string                 agent_id;
  std::function<db::Result()> run;
};

} // namespace foreman::persistence
