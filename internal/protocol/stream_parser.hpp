#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "foreman/v1/agent.pb.h"
#include "messages.hpp"
#include "session_index.hpp"

namespace foreman::protocol {

/*
  What a parsed line means for the worker's turn state.

  kToolInvoked   the assistant used a tool, work continues
  kTurnEnded     assistant stopped with end_turn and no tool use
  kTurnSucceeded result with subtype "success"
  kTurnFailed    result with any other subtype
  kContinuing    anything that neither starts nor finishes a turn
  kPlainText     the line was not JSON; no state change
*/
enum class LineSignal {
  kNone,
  kToolInvoked,
  kTurnEnded,
  kTurnSucceeded,
  kTurnFailed,
  kContinuing,
  kPlainText,
};

std::string_view SignalName(LineSignal signal);

// One entry of a result message's modelUsage object. Fields missing from the report stay unset.
struct ModelUsageReport {
  std::optional<uint64_t> input_tokens;
  std::optional<uint64_t> output_tokens;
  std::optional<uint64_t> cache_creation_input_tokens;
  std::optional<uint64_t> cache_read_input_tokens;
  std::optional<double>   cost_usd;
  std::optional<uint64_t> context_window;
  std::optional<uint64_t> max_output_tokens;
};

struct ResultUsage {
  std::optional<double>                   total_cost_usd;
  std::map<std::string, ModelUsageReport> model_usage;
  std::optional<uint64_t>                 duration_api_ms;
  std::optional<uint64_t>                 duration_ms;
  std::optional<uint64_t>                 num_turns;
  std::optional<uint64_t>                 input_tokens;
  std::optional<uint64_t>                 output_tokens;
};

ResultUsage ExtractResultUsage(const google::protobuf::Struct& result);

struct ParsedLine {
  std::vector<foreman::v1::OutputEvent> events;
  LineSignal                            signal = LineSignal::kNone;
  std::optional<ResultUsage>            usage;
  std::optional<std::string>            last_text;
  std::optional<std::string>            session_id;
  bool                                  has_tool_use = false;
  uint64_t                              tool_calls   = 0;
};

/*
  Turns stdout lines of one worker into output events.

  Stateless apart from the agent id; turn bookkeeping lives in the
  supervisor, which applies ParsedLine::signal to the worker record.
*/
class StreamParser {
 public:
  StreamParser(std::string agent_id, SessionIndex* sessions);

  ParsedLine Parse(std::string_view line) const;

  foreman::v1::OutputEvent ParseStderr(std::string_view line) const;

 private:
  void ParseSystem(const SystemMessage& message, ParsedLine& out) const;
  void ParseAssistant(const AssistantMessage& message, ParsedLine& out) const;
  void ParseUser(const UserMessage& message, ParsedLine& out) const;
  void ParseResult(const ResultMessage& message, ParsedLine& out) const;
  void ParseStreamEvent(const StreamEventMessage& message, ParsedLine& out) const;

  foreman::v1::OutputEvent MakeEvent(std::string_view type, std::string content, const CommonFields* common) const;

  std::string   agent_id_;
  SessionIndex* sessions_;
};

} // namespace foreman::protocol
