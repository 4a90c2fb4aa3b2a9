#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "foreman/v1/run.pb.h"

namespace foreman::db::model {

/*
  One supervised worker lifetime.

  agent_id is unique. ended_at_ms == 0 means the run has not ended.
  total_tokens_used / total_cost_usd stay unset until a result reports them.
*/
struct RunRecord {
  int64_t id = 0; // assigned by the backend on insert

  std::string agent_id;
  std::string session_id;
  std::string working_dir;
  std::string source; // "ui" | "manual" | "pipeline" | ...
  std::string pipeline_id;

  foreman::v1::RunStatus status = foreman::v1::RUN_STATUS_RUNNING;

  int64_t started_at_ms    = 0;
  int64_t ended_at_ms      = 0;
  int64_t last_activity_ms = 0;

  std::string initial_prompt;
  std::string error_message;

  uint64_t total_prompts      = 0;
  uint64_t total_tool_calls   = 0;
  uint64_t total_output_bytes = 0;

  std::optional<uint64_t> total_tokens_used;
  std::optional<double>   total_cost_usd;

  // JSON object keyed by model name
  std::string model_usage_json;

  bool        can_resume = false;
  std::string resume_data;
};

struct RunQuery {
  std::optional<foreman::v1::RunStatus> status;
  std::string                           working_dir; // empty = any
  std::string                           source;      // empty = any
  int64_t                               date_from_ms = 0;
  int64_t                               date_to_ms   = 0;
  uint32_t                              limit        = 0; // 0 = no limit
  uint32_t                              offset       = 0;
};

// Persisted status spelling
inline const char* RunStatusName(foreman::v1::RunStatus status) {
  switch (status) {
    case foreman::v1::RUN_STATUS_RUNNING:
      return "running";
    case foreman::v1::RUN_STATUS_COMPLETED:
      return "completed";
    case foreman::v1::RUN_STATUS_STOPPED:
      return "stopped";
    case foreman::v1::RUN_STATUS_CRASHED:
      return "crashed";
    case foreman::v1::RUN_STATUS_WAITING_INPUT:
      return "waiting_input";
    default:
      return "unspecified";
  }
}

inline foreman::v1::RunStatus ParseRunStatus(const std::string& name) {
  if (name == "running") return foreman::v1::RUN_STATUS_RUNNING;
  if (name == "completed") return foreman::v1::RUN_STATUS_COMPLETED;
  if (name == "stopped") return foreman::v1::RUN_STATUS_STOPPED;
  if (name == "crashed") return foreman::v1::RUN_STATUS_CRASHED;
  if (name == "waiting_input") return foreman::v1::RUN_STATUS_WAITING_INPUT;
  return foreman::v1::RUN_STATUS_UNSPECIFIED;
}

inline bool IsLiveRunStatus(foreman::v1::RunStatus status) {
  return status == foreman::v1::RUN_STATUS_RUNNING || status == foreman::v1::RUN_STATUS_WAITING_INPUT;
}

} // namespace foreman::db::model
