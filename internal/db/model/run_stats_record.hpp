#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace foreman::db::model {

struct RunStatsRecord {
  uint64_t                        total_runs = 0;
  std::map<std::string, uint64_t> by_status;
  std::map<std::string, uint64_t> by_source;
  double                          total_cost_usd = 0.0;
  uint64_t                        resumable_runs = 0;
};

} // namespace foreman::db::model
