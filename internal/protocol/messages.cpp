#include "messages.hpp"

#include <type_traits>

#include "internal/util/json.hpp"

namespace foreman::protocol {

namespace {

CommonFields ExtractCommon(const google::protobuf::Struct& object) {
  CommonFields common;
  common.session_id         = util::GetString(object, "session_id");
  common.uuid               = util::GetString(object, "uuid");
  common.parent_tool_use_id = util::GetString(object, "parent_tool_use_id");
  common.subtype            = util::GetString(object, "subtype");
  return common;
}

template <typename T>
Message Make(google::protobuf::Struct&& object) {
  T message;
  message.common = ExtractCommon(object);
  message.object = std::move(object);
  return message;
}

} // namespace

Message Decode(std::string_view line) {
  auto object = util::ParseObject(line);
  if (!object) {
    return PlainText{std::string(line)};
  }

  const auto type = util::GetString(*object, "type").value_or("");
  if (type == "system") {
    return Make<SystemMessage>(std::move(*object));
  }
  if (type == "assistant") {
    return Make<AssistantMessage>(std::move(*object));
  }
  if (type == "user") {
    return Make<UserMessage>(std::move(*object));
  }
  if (type == "result") {
    return Make<ResultMessage>(std::move(*object));
  }
  if (type == "stream_event") {
    return Make<StreamEventMessage>(std::move(*object));
  }

  UnknownMessage unknown;
  unknown.common = ExtractCommon(*object);
  unknown.type   = type;
  unknown.object = std::move(*object);
  return unknown;
}

const CommonFields* Common(const Message& message) {
  return std::visit(
      [](const auto& m) -> const CommonFields* {
        if constexpr (std::is_same_v<std::decay_t<decltype(m)>, PlainText>) {
          return nullptr;
        } else {
          return &m.common;
        }
      },
      message);
}

} // namespace foreman::protocol
