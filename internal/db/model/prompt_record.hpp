#pragma once

#include <cstdint>
#include <string>

namespace foreman::db::model {

struct PromptRecord {
  int64_t     id = 0;
  std::string agent_id;
  std::string prompt;
  int64_t     timestamp_ms = 0;
};

} // namespace foreman::db::model
