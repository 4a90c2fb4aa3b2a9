#include "internal/supervisor/statistics.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/json.hpp"

namespace {

using foreman::protocol::ModelUsageReport;
using foreman::protocol::ResultUsage;
using foreman::supervisor::AgentStatistics;

ResultUsage MakeUsage(double cost, uint64_t input, uint64_t output) {
  ResultUsage usage;
  usage.total_cost_usd = cost;
  usage.duration_ms    = 1000;
  usage.num_turns      = 2;
  usage.input_tokens   = input;
  usage.output_tokens  = output;

  ModelUsageReport report;
  report.input_tokens   = input;
  report.output_tokens  = output;
  report.cost_usd       = cost;
  report.context_window = 200000;
  usage.model_usage.emplace("claude-sonnet", report);
  return usage;
}

void TestFreshStatisticsHaveNoOptionalTotals() {
  AgentStatistics stats;
  assert(stats.total_prompts == 0);
  assert(!stats.total_cost_usd.has_value());
  assert(!stats.total_tokens_used.has_value());

  const auto proto = stats.ToProto();
  assert(!proto.has_total_cost_usd());
  assert(proto.model_usage().empty());
}

void TestCountersAccumulate() {
  AgentStatistics stats;
  stats.IncrementPrompts();
  stats.IncrementPrompts();
  stats.IncrementToolCalls();
  stats.IncrementToolCalls(3);
  stats.AddOutputBytes(10);
  stats.AddOutputBytes(5);

  assert(stats.total_prompts == 2);
  assert(stats.total_tool_calls == 4);
  assert(stats.total_output_bytes == 15);
}

void TestResultsMergeAdditively() {
  AgentStatistics stats;
  stats.MergeResult(MakeUsage(0.5, 100, 20), 7);
  stats.MergeResult(MakeUsage(0.25, 50, 10), 3);

  assert(stats.total_cost_usd == 0.75);
  assert(stats.total_tokens_used == 180u);
  assert(stats.duration_ms == 2000u);
  assert(stats.num_turns == 4u);
  assert(stats.total_output_bytes == 10);

  const auto& model = stats.model_usage.at("claude-sonnet");
  assert(model.input_tokens == 150);
  assert(model.output_tokens == 30);
  assert(model.cost_usd == 0.75);
  assert(model.context_window == 200000u);
  assert(!stats.duration_api_ms.has_value());
}

void TestModelUsageJsonIsKeyedByModel() {
  AgentStatistics stats;
  stats.MergeResult(MakeUsage(0.5, 100, 20), 0);

  const auto root = foreman::util::ParseObject(stats.ModelUsageJson());
  assert(root.has_value());
  const auto model = foreman::util::GetObject(*root, "claude-sonnet");
  assert(model != nullptr);
  assert(foreman::util::GetNumber(*model, "input_tokens") == 100.0);
  assert(foreman::util::GetNumber(*model, "context_window") == 200000.0);
  assert(!foreman::util::GetNumber(*model, "max_output_tokens").has_value());
}

void TestProtoCarriesMergedTotals() {
  AgentStatistics stats;
  stats.IncrementPrompts();
  stats.MergeResult(MakeUsage(1.0, 10, 5), 4);

  const auto proto = stats.ToProto();
  assert(proto.total_prompts() == 1);
  assert(proto.total_cost_usd() == 1.0);
  assert(proto.total_tokens_used() == 15);
  assert(proto.num_turns() == 2);
  assert(proto.model_usage().at("claude-sonnet").output_tokens() == 5);
}

} // namespace

int main() {
  TestFreshStatisticsHaveNoOptionalTotals();
  TestCountersAccumulate();
  TestResultsMergeAdditively();
  TestModelUsageJsonIsKeyedByModel();
  TestProtoCarriesMergedTotals();

  std::cout << "foreman_unit_statistics: pass\n";
  return 0;
}
