#include "stream_parser.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace foreman::protocol {

namespace {

std::optional<std::string> StringOf(const google::protobuf::Value* value) {
  if (value == nullptr || value->kind_case() != google::protobuf::Value::kStringValue) {
    return std::nullopt;
  }
  return value->string_value();
}

const google::protobuf::Struct* ObjectOf(const google::protobuf::Value* value) {
  if (value == nullptr || value->kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  return &value->struct_value();
}

const google::protobuf::ListValue* ContentBlocks(const google::protobuf::Struct& object) {
  const auto* message = util::GetObject(object, "message");
  if (message == nullptr) {
    return nullptr;
  }
  return util::GetList(*message, "content");
}

google::protobuf::Value WholeObject(const google::protobuf::Struct& object) {
  google::protobuf::Value value;
  *value.mutable_struct_value() = object;
  return value;
}

std::string SystemContent(const SystemMessage& message) {
  if (auto text = util::GetString(message.object, "message")) {
    return *text;
  }
  if (const auto* init = util::Find(message.object, "init")) {
    std::string model       = "unknown";
    size_t      tools_count = 0;
    if (const auto* init_object = ObjectOf(init)) {
      model = util::GetString(*init_object, "model").value_or("unknown");
      if (const auto* tools = util::GetList(*init_object, "tools")) {
        tools_count = static_cast<size_t>(tools->values_size());
      }
    }
    return "Session initialized with " + model + " (" + std::to_string(tools_count) + " tools available)";
  }
  if (message.common.subtype) {
    return "System: " + *message.common.subtype;
  }
  return "System event";
}

std::string ResultContent(const ResultMessage& message) {
  const auto& object = message.object;
  if (const auto* result = util::Find(object, "result")) {
    if (auto text = StringOf(result)) {
      return *text;
    }
    if (const auto* result_object = ObjectOf(result)) {
      if (auto summary = util::GetString(*result_object, "summary")) {
        return *summary;
      }
      if (auto text = util::GetString(*result_object, "message")) {
        return *text;
      }
    }

    std::ostringstream out;
    out << "Task completed";
    if (auto duration = util::GetUnsigned(object, "duration_ms")) {
      out << " in " << std::fixed << std::setprecision(1) << static_cast<double>(*duration) / 1000.0 << "s";
    }
    if (auto cost = util::GetNumber(object, "cost_usd")) {
      out << " ($" << std::fixed << std::setprecision(4) << *cost << ")";
    }
    return out.str();
  }
  if (auto error = util::GetString(object, "error")) {
    return "Error: " + *error;
  }
  if (message.common.subtype == "success") {
    return "Task completed successfully";
  }
  if (message.common.subtype == "error") {
    return "Task failed";
  }
  return "Result";
}

std::string StreamEventContent(const StreamEventMessage& message) {
  const auto& object = message.object;
  const auto  event  = util::GetString(object, "event").value_or("stream");

  if (const auto* data = util::Find(object, "data")) {
    if (auto text = StringOf(data)) {
      return *text;
    }
    if (const auto* data_object = ObjectOf(data)) {
      if (auto text = util::GetString(*data_object, "message")) {
        return *text;
      }
      if (auto status = util::GetString(*data_object, "status")) {
        return event + ": " + *status;
      }
    }
    return "Stream: " + event;
  }
  if (auto text = util::GetString(object, "message")) {
    return *text;
  }
  return "Stream: " + event;
}

} // namespace

std::string_view SignalName(LineSignal signal) {
  switch (signal) {
    case LineSignal::kNone:
      return "none";
    case LineSignal::kToolInvoked:
      return "tool_invoked";
    case LineSignal::kTurnEnded:
      return "turn_ended";
    case LineSignal::kTurnSucceeded:
      return "turn_succeeded";
    case LineSignal::kTurnFailed:
      return "turn_failed";
    case LineSignal::kContinuing:
      return "continuing";
    case LineSignal::kPlainText:
      return "plain_text";
  }
  return "none";
}

ResultUsage ExtractResultUsage(const google::protobuf::Struct& result) {
  ResultUsage usage;
  usage.total_cost_usd  = util::GetNumber(result, "total_cost_usd");
  usage.duration_api_ms = util::GetUnsigned(result, "duration_api_ms");
  usage.duration_ms     = util::GetUnsigned(result, "duration_ms");
  usage.num_turns       = util::GetUnsigned(result, "num_turns");

  if (const auto* tokens = util::GetObject(result, "usage")) {
    usage.input_tokens  = util::GetUnsigned(*tokens, "input_tokens");
    usage.output_tokens = util::GetUnsigned(*tokens, "output_tokens");
  }

  if (const auto* models = util::GetObject(result, "modelUsage")) {
    for (const auto& [name, value] : models->fields()) {
      const auto* entry = ObjectOf(&value);
      if (entry == nullptr) {
        continue;
      }
      ModelUsageReport report;
      report.input_tokens                = util::GetUnsigned(*entry, "inputTokens");
      report.output_tokens               = util::GetUnsigned(*entry, "outputTokens");
      report.cache_creation_input_tokens = util::GetUnsigned(*entry, "cacheCreationInputTokens");
      report.cache_read_input_tokens     = util::GetUnsigned(*entry, "cacheReadInputTokens");
      report.cost_usd                    = util::GetNumber(*entry, "costUSD");
      report.context_window              = util::GetUnsigned(*entry, "contextWindow");
      report.max_output_tokens           = util::GetUnsigned(*entry, "maxOutputTokens");
      usage.model_usage.emplace(name, report);
    }
  }
  return usage;
}

StreamParser::StreamParser(std::string agent_id, SessionIndex* sessions) : agent_id_(std::move(agent_id)), sessions_(sessions) {
}

ParsedLine StreamParser::Parse(std::string_view line) const {
  ParsedLine out;
  const auto message = Decode(line);

  if (const auto* common = Common(message); common != nullptr && common->session_id) {
    out.session_id = common->session_id;
    if (sessions_ != nullptr) {
      sessions_->Register(*common->session_id, agent_id_);
    }
  }

  std::visit(
      [&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SystemMessage>) {
          ParseSystem(m, out);
        } else if constexpr (std::is_same_v<T, AssistantMessage>) {
          ParseAssistant(m, out);
        } else if constexpr (std::is_same_v<T, UserMessage>) {
          ParseUser(m, out);
        } else if constexpr (std::is_same_v<T, ResultMessage>) {
          ParseResult(m, out);
        } else if constexpr (std::is_same_v<T, StreamEventMessage>) {
          ParseStreamEvent(m, out);
        } else if constexpr (std::is_same_v<T, UnknownMessage>) {
          out.events.push_back(MakeEvent("unknown", std::string(line), &m.common));
          out.signal = LineSignal::kContinuing;
        } else {
          out.events.push_back(MakeEvent("plain_text", m.line, nullptr));
          out.signal = LineSignal::kPlainText;
        }
      },
      message);

  return out;
}

foreman::v1::OutputEvent StreamParser::ParseStderr(std::string_view line) const {
  return MakeEvent("error", std::string(line), nullptr);
}

void StreamParser::ParseSystem(const SystemMessage& message, ParsedLine& out) const {
  auto event                   = MakeEvent("system", SystemContent(message), &message.common);
  *event.mutable_parsed_json() = WholeObject(message.object);
  out.events.push_back(std::move(event));
  out.signal = LineSignal::kContinuing;
}

void StreamParser::ParseAssistant(const AssistantMessage& message, ParsedLine& out) const {
  if (const auto* blocks = ContentBlocks(message.object)) {
    for (const auto& block_value : blocks->values()) {
      const auto* block = ObjectOf(&block_value);
      if (block == nullptr) {
        continue;
      }
      const auto block_type = util::GetString(*block, "type").value_or("");

      if (block_type == "text") {
        auto text = util::GetString(*block, "text");
        if (!text) {
          continue;
        }
        out.last_text = *text;
        out.events.push_back(MakeEvent("text", *text, &message.common));
      } else if (block_type == "tool_use") {
        const auto name = util::GetString(*block, "name").value_or("unknown");

        google::protobuf::Value input;
        if (const auto* found = util::Find(*block, "input")) {
          input = *found;
        } else {
          input.set_null_value(google::protobuf::NULL_VALUE);
        }

        auto event                   = MakeEvent("tool_use", "Using tool: " + name + "\nInput:\n" + util::ToJson(input, true), &message.common);
        *event.mutable_parsed_json() = input;
        out.events.push_back(std::move(event));
        out.has_tool_use = true;
        ++out.tool_calls;
      }
    }
  }

  std::optional<std::string> stop_reason;
  if (const auto* inner = util::GetObject(message.object, "message")) {
    stop_reason = util::GetString(*inner, "stop_reason");
  }

  if (out.has_tool_use) {
    out.signal = LineSignal::kToolInvoked;
  } else if (stop_reason == "end_turn") {
    out.signal = LineSignal::kTurnEnded;
  } else {
    out.signal = LineSignal::kContinuing;
  }
}

void StreamParser::ParseUser(const UserMessage& message, ParsedLine& out) const {
  out.signal = LineSignal::kContinuing;

  const auto* blocks = ContentBlocks(message.object);
  if (blocks == nullptr) {
    return;
  }

  for (const auto& block_value : blocks->values()) {
    const auto* block = ObjectOf(&block_value);
    if (block == nullptr || util::GetString(*block, "type") != "tool_result") {
      continue;
    }
    const auto* content = util::Find(*block, "content");
    if (content == nullptr) {
      continue;
    }

    const bool is_error = util::GetBool(*block, "is_error").value_or(false);
    const auto type     = is_error ? "error" : "tool_result";

    if (auto text = StringOf(content)) {
      out.events.push_back(MakeEvent(type, *text, &message.common));
    } else {
      auto event                   = MakeEvent(type, util::ToJson(*content, true), &message.common);
      *event.mutable_parsed_json() = *content;
      out.events.push_back(std::move(event));
    }
  }
}

void StreamParser::ParseResult(const ResultMessage& message, ParsedLine& out) const {
  auto event                   = MakeEvent("result", ResultContent(message), &message.common);
  *event.mutable_parsed_json() = WholeObject(message.object);
  out.events.push_back(std::move(event));
  out.usage = ExtractResultUsage(message.object);

  if (message.common.subtype == "success") {
    out.signal = LineSignal::kTurnSucceeded;
  } else if (message.common.subtype) {
    out.signal = LineSignal::kTurnFailed;
  } else {
    out.signal = LineSignal::kContinuing;
  }
}

void StreamParser::ParseStreamEvent(const StreamEventMessage& message, ParsedLine& out) const {
  auto event                   = MakeEvent("stream_event", StreamEventContent(message), &message.common);
  *event.mutable_parsed_json() = WholeObject(message.object);
  out.events.push_back(std::move(event));
  out.signal = LineSignal::kContinuing;
}

foreman::v1::OutputEvent StreamParser::MakeEvent(std::string_view type, std::string content, const CommonFields* common) const {
  foreman::v1::OutputEvent event;
  event.set_agent_id(agent_id_);
  event.set_output_type(std::string(type));
  event.set_byte_size(content.size());
  event.set_content(std::move(content));
  event.set_timestamp_ms(util::NowMillis());

  if (common != nullptr) {
    if (common->session_id) {
      event.set_session_id(*common->session_id);
    }
    if (common->uuid) {
      event.set_uuid(*common->uuid);
    }
    if (common->parent_tool_use_id) {
      event.set_parent_tool_use_id(*common->parent_tool_use_id);
    }
    if (common->subtype) {
      event.set_subtype(*common->subtype);
    }
  }
  return event;
}

} // namespace foreman::protocol
