#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "foreman/v1/agent.pb.h"
#include "internal/protocol/stream_parser.hpp"

namespace foreman::supervisor {

struct ModelUsage {
  uint64_t                input_tokens                = 0;
  uint64_t                output_tokens               = 0;
  uint64_t                cache_creation_input_tokens = 0;
  uint64_t                cache_read_input_tokens     = 0;
  double                  cost_usd                    = 0.0;
  std::optional<uint64_t> context_window;
  std::optional<uint64_t> max_output_tokens;
};

/*
  Per-worker counters. Every counter only grows.

  Result reports are merged additively: a worker that runs several turns
  accumulates cost, durations and per-model token counts across them.
*/
struct AgentStatistics {
  uint64_t                          total_prompts      = 0;
  uint64_t                          total_tool_calls   = 0;
  uint64_t                          total_output_bytes = 0;
  std::optional<uint64_t>           total_tokens_used;
  std::optional<double>             total_cost_usd;
  std::map<std::string, ModelUsage> model_usage;
  std::optional<uint64_t>           duration_api_ms;
  std::optional<uint64_t>           duration_ms;
  std::optional<uint64_t>           num_turns;
  int64_t                           session_started_at_ms = 0;
  int64_t                           last_activity_ms      = 0;

  void AddOutputBytes(uint64_t bytes);
  void IncrementToolCalls(uint64_t count = 1);
  void IncrementPrompts();
  void MergeResult(const protocol::ResultUsage& usage, uint64_t bytes);

  // JSON object keyed by model name, as stored in the run record
  std::string ModelUsageJson() const;

  foreman::v1::AgentStatistics ToProto() const;
};

} // namespace foreman::supervisor
