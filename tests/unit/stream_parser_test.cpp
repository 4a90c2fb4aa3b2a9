#include "internal/protocol/stream_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/protocol/messages.hpp"
#include "internal/protocol/session_index.hpp"

namespace {

using foreman::protocol::LineSignal;
using foreman::protocol::SessionIndex;
using foreman::protocol::StreamParser;

void TestToolUseYieldsOneEventAndCountsOneCall() {
  StreamParser parser("agent-1", nullptr);
  const auto   out =
      parser.Parse(R"({"type":"assistant","message":{"content":[{"type":"tool_use","name":"Bash","input":{"command":"ls"}}]}})");

  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "tool_use");
  assert(out.events[0].agent_id() == "agent-1");
  assert(out.events[0].content().rfind("Using tool: Bash\nInput:\n", 0) == 0);
  assert(out.events[0].content().find("\"command\"") != std::string::npos);
  assert(out.events[0].parsed_json().struct_value().fields().at("command").string_value() == "ls");
  assert(out.tool_calls == 1);
  assert(out.has_tool_use);
  assert(out.signal == LineSignal::kToolInvoked);
}

void TestEndTurnTextSignalsTurnEnded() {
  StreamParser parser("agent-1", nullptr);
  const auto   out = parser.Parse(R"({"type":"assistant","message":{"content":[{"type":"text","text":"Done"}],"stop_reason":"end_turn"}})");

  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "text");
  assert(out.events[0].content() == "Done");
  assert(out.last_text == std::string("Done"));
  assert(out.signal == LineSignal::kTurnEnded);
}

void TestToolUseWinsOverEndTurn() {
  StreamParser parser("agent-1", nullptr);
  const auto   out = parser.Parse(
      R"({"type":"assistant","message":{"content":[{"type":"text","text":"checking"},{"type":"tool_use","name":"Read","input":{}}],"stop_reason":"end_turn"}})");

  assert(out.events.size() == 2);
  assert(out.signal == LineSignal::kToolInvoked);
}

void TestPlainTextLeavesStateAlone() {
  StreamParser parser("agent-1", nullptr);
  const auto   out = parser.Parse("hello world");

  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "plain_text");
  assert(out.events[0].content() == "hello world");
  assert(out.signal == LineSignal::kPlainText);
  assert(!out.usage.has_value());
}

void TestMalformedJsonDegradesToPlainText() {
  StreamParser parser("agent-1", nullptr);
  const auto   out = parser.Parse(R"({"type":"assistant","message":)");
  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "plain_text");
}

void TestUnknownTypeIsKeptVerbatim() {
  StreamParser      parser("agent-1", nullptr);
  const std::string line = R"({"type":"telemetry","value":3})";
  const auto        out  = parser.Parse(line);
  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "unknown");
  assert(out.events[0].content() == line);
}

void TestSystemInitDescribesSession() {
  SessionIndex sessions;
  StreamParser parser("agent-7", &sessions);
  const auto   out =
      parser.Parse(R"({"type":"system","subtype":"init","session_id":"sess-1","model":"claude-sonnet","tools":["Bash","Read","Edit"]})");

  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "system");
  assert(out.events[0].content() == "Session initialized with claude-sonnet (3 tools available)");
  assert(out.events[0].session_id() == "sess-1");
  assert(out.session_id == std::string("sess-1"));
  assert(sessions.Lookup("sess-1") == std::string("agent-7"));
}

void TestSessionIndexKeepsFirstOwner() {
  SessionIndex sessions;
  assert(sessions.Register("sess-1", "agent-a"));
  assert(!sessions.Register("sess-1", "agent-b"));
  assert(sessions.Lookup("sess-1") == std::string("agent-a"));
  sessions.ForgetAgent("agent-a");
  assert(!sessions.Lookup("sess-1").has_value());
}

void TestSuccessResultCarriesUsage() {
  StreamParser parser("agent-1", nullptr);
  const auto   out = parser.Parse(
      R"({"type":"result","subtype":"success","result":"All done","total_cost_usd":0.25,"duration_ms":1500,"duration_api_ms":1200,"num_turns":3,)"
      R"("usage":{"input_tokens":100,"output_tokens":40},)"
      R"("modelUsage":{"claude-sonnet":{"inputTokens":100,"outputTokens":40,"cacheReadInputTokens":7,"costUSD":0.25,"contextWindow":200000}}})");

  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "result");
  assert(out.events[0].content() == "All done");
  assert(out.signal == LineSignal::kTurnSucceeded);
  assert(out.usage.has_value());
  assert(out.usage->total_cost_usd == 0.25);
  assert(out.usage->duration_ms == 1500u);
  assert(out.usage->num_turns == 3u);
  assert(out.usage->input_tokens == 100u);
  assert(out.usage->output_tokens == 40u);

  const auto& model = out.usage->model_usage.at("claude-sonnet");
  assert(model.input_tokens == 100u);
  assert(model.cache_read_input_tokens == 7u);
  assert(!model.cache_creation_input_tokens.has_value());
  assert(model.context_window == 200000u);
  assert(!model.max_output_tokens.has_value());
}

void TestErrorResultSignalsFailure() {
  StreamParser parser("agent-1", nullptr);
  const auto   out = parser.Parse(R"({"type":"result","subtype":"error_max_turns"})");
  assert(out.signal == LineSignal::kTurnFailed);
  assert(out.events.size() == 1);
}

void TestToolResultErrorBecomesErrorEvent() {
  StreamParser parser("agent-1", nullptr);
  const auto   out =
      parser.Parse(R"({"type":"user","message":{"content":[{"type":"tool_result","content":"permission denied","is_error":true}]}})");
  assert(out.events.size() == 1);
  assert(out.events[0].output_type() == "error");
  assert(out.events[0].content() == "permission denied");
  assert(out.signal == LineSignal::kContinuing);
}

void TestStderrIsForwardedVerbatim() {
  StreamParser parser("agent-1", nullptr);
  const auto   event = parser.ParseStderr("warning: something odd");
  assert(event.output_type() == "error");
  assert(event.content() == "warning: something odd");
  assert(event.byte_size() == std::string("warning: something odd").size());
}

void TestParsingIsRepeatable() {
  StreamParser      parser("agent-1", nullptr);
  const std::string line = R"({"type":"assistant","message":{"content":[{"type":"text","text":"x"}]}})";
  const auto        first  = parser.Parse(line);
  const auto        second = parser.Parse(line);
  assert(first.events.size() == second.events.size());
  assert(first.events[0].content() == second.events[0].content());
  assert(first.signal == second.signal);
  assert(first.signal == LineSignal::kContinuing);
}

} // namespace

int main() {
  TestToolUseYieldsOneEventAndCountsOneCall();
  TestEndTurnTextSignalsTurnEnded();
  TestToolUseWinsOverEndTurn();
  TestPlainTextLeavesStateAlone();
  TestMalformedJsonDegradesToPlainText();
  TestUnknownTypeIsKeptVerbatim();
  TestSystemInitDescribesSession();
  TestSessionIndexKeepsFirstOwner();
  TestSuccessResultCarriesUsage();
  TestErrorResultSignalsFailure();
  TestToolResultErrorBecomesErrorEvent();
  TestStderrIsForwardedVerbatim();
  TestParsingIsRepeatable();

  std::cout << "foreman_unit_stream_parser: pass\n";
  return 0;
}
