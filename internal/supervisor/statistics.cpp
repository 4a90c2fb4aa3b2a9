#include "statistics.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/util/json.hpp"

namespace foreman::supervisor {

namespace {

template <typename T>
void AddTo(std::optional<T>& total, T amount) {
  total = total.value_or(T{}) + amount;
}

} // namespace

void AgentStatistics::AddOutputBytes(uint64_t bytes) {
  total_output_bytes += bytes;
}

void AgentStatistics::IncrementToolCalls(uint64_t count) {
  total_tool_calls += count;
}

void AgentStatistics::IncrementPrompts() {
  ++total_prompts;
}

void AgentStatistics::MergeResult(const protocol::ResultUsage& usage, uint64_t bytes) {
  if (usage.total_cost_usd) {
    AddTo(total_cost_usd, *usage.total_cost_usd);
  }

  for (const auto& [name, report] : usage.model_usage) {
    auto [it, inserted] = model_usage.try_emplace(name);
    auto& entry         = it->second;
    if (inserted) {
      entry.context_window    = report.context_window;
      entry.max_output_tokens = report.max_output_tokens;
    }
    entry.input_tokens += report.input_tokens.value_or(0);
    entry.output_tokens += report.output_tokens.value_or(0);
    entry.cache_creation_input_tokens += report.cache_creation_input_tokens.value_or(0);
    entry.cache_read_input_tokens += report.cache_read_input_tokens.value_or(0);
    entry.cost_usd += report.cost_usd.value_or(0.0);
  }

  if (usage.duration_api_ms) {
    AddTo(duration_api_ms, *usage.duration_api_ms);
  }
  if (usage.duration_ms) {
    AddTo(duration_ms, *usage.duration_ms);
  }
  if (usage.num_turns) {
    AddTo(num_turns, *usage.num_turns);
  }

  const uint64_t tokens = usage.input_tokens.value_or(0) + usage.output_tokens.value_or(0);
  if (tokens > 0) {
    AddTo(total_tokens_used, tokens);
  }

  total_output_bytes += bytes;
}

std::string AgentStatistics::ModelUsageJson() const {
  google::protobuf::Struct root;
  for (const auto& [name, usage] : model_usage) {
    auto& entry = *(*root.mutable_fields())[name].mutable_struct_value()->mutable_fields();
    entry["input_tokens"]                = util::NumberValue(static_cast<double>(usage.input_tokens));
    entry["output_tokens"]               = util::NumberValue(static_cast<double>(usage.output_tokens));
    entry["cache_creation_input_tokens"] = util::NumberValue(static_cast<double>(usage.cache_creation_input_tokens));
    entry["cache_read_input_tokens"]     = util::NumberValue(static_cast<double>(usage.cache_read_input_tokens));
    entry["cost_usd"]                    = util::NumberValue(usage.cost_usd);
    if (usage.context_window) {
      entry["context_window"] = util::NumberValue(static_cast<double>(*usage.context_window));
    }
    if (usage.max_output_tokens) {
      entry["max_output_tokens"] = util::NumberValue(static_cast<double>(*usage.max_output_tokens));
    }
  }
  return util::ToJson(root);
}

foreman::v1::AgentStatistics AgentStatistics::ToProto() const {
  foreman::v1::AgentStatistics out;
  out.set_total_prompts(total_prompts);
  out.set_total_tool_calls(total_tool_calls);
  out.set_total_output_bytes(total_output_bytes);
  if (total_tokens_used) {
    out.set_total_tokens_used(*total_tokens_used);
  }
  if (total_cost_usd) {
    out.set_total_cost_usd(*total_cost_usd);
  }
  for (const auto& [name, usage] : model_usage) {
    auto& entry = (*out.mutable_model_usage())[name];
    entry.set_input_tokens(usage.input_tokens);
    entry.set_output_tokens(usage.output_tokens);
    entry.set_cache_creation_input_tokens(usage.cache_creation_input_tokens);
    entry.set_cache_read_input_tokens(usage.cache_read_input_tokens);
    entry.set_cost_usd(usage.cost_usd);
    if (usage.context_window) {
      entry.set_context_window(*usage.context_window);
    }
    if (usage.max_output_tokens) {
      entry.set_max_output_tokens(*usage.max_output_tokens);
    }
  }
  if (duration_api_ms) {
    out.set_duration_api_ms(*duration_api_ms);
  }
  if (duration_ms) {
    out.set_duration_ms(*duration_ms);
  }
  if (num_turns) {
    out.set_num_turns(static_cast<uint32_t>(*num_turns));
  }
  out.set_session_started_at_ms(session_started_at_ms);
  out.set_last_activity_ms(last_activity_ms);
  return out;
}

} // namespace foreman::supervisor
