#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace foreman::protocol {

/*
  One decoded line of the worker's stream-json output.

  The set of kinds is closed. Every kind keeps the decoded object so the
  parser can attach it as the event payload without re-parsing.
*/

struct CommonFields {
  std::optional<std::string> session_id;
  std::optional<std::string> uuid;
  std::optional<std::string> parent_tool_use_id;
  std::optional<std::string> subtype;
};

struct SystemMessage {
  CommonFields             common;
  google::protobuf::Struct object;
};

struct AssistantMessage {
  CommonFields             common;
  google::protobuf::Struct object;
};

struct UserMessage {
  CommonFields             common;
  google::protobuf::Struct object;
};

struct ResultMessage {
  CommonFields             common;
  google::protobuf::Struct object;
};

struct StreamEventMessage {
  CommonFields             common;
  google::protobuf::Struct object;
};

// JSON object with a missing or unrecognised "type".
struct UnknownMessage {
  CommonFields             common;
  std::string              type;
  google::protobuf::Struct object;
};

// Anything that is not a JSON object.
struct PlainText {
  std::string line;
};

using Message = std::variant<SystemMessage, AssistantMessage, UserMessage, ResultMessage, StreamEventMessage, UnknownMessage, PlainText>;

// Never fails: undecodable input becomes PlainText.
Message Decode(std::string_view line);

const CommonFields* Common(const Message& message);

} // namespace foreman::protocol
