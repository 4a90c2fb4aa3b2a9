#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>

namespace foreman::util {

namespace {

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(first, last - first + 1));
}

std::optional<std::string> FencedBlock(std::string_view text, std::string_view opener) {
  const auto start = text.find(opener);
  if (start == std::string_view::npos) {
    return std::nullopt;
  }
  const auto newline = text.find('\n', start);
  if (newline == std::string_view::npos) {
    return std::nullopt;
  }
  const auto content_start = newline + 1;
  const auto end           = text.find("```", content_start);
  if (end == std::string_view::npos) {
    return std::nullopt;
  }
  return Trim(text.substr(content_start, end - content_start));
}

std::optional<std::string> Enclosed(std::string_view text, char open, char close) {
  const auto start = text.find(open);
  const auto end   = text.rfind(close);
  if (start == std::string_view::npos || end == std::string_view::npos || end < start) {
    return std::nullopt;
  }
  return std::string(text.substr(start, end - start + 1));
}

} // namespace

std::optional<google::protobuf::Struct> ParseObject(std::string_view text) {
  const auto trimmed = Trim(text);
  if (trimmed.empty() || trimmed.front() != '{') {
    return std::nullopt;
  }

  google::protobuf::Struct object;
  if (!google::protobuf::util::JsonStringToMessage(trimmed, &object).ok()) {
    return std::nullopt;
  }
  return object;
}

std::optional<google::protobuf::Value> ParseValue(std::string_view text) {
  const auto trimmed = Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  google::protobuf::Value value;
  if (!google::protobuf::util::JsonStringToMessage(trimmed, &value).ok()) {
    return std::nullopt;
  }
  return value;
}

const google::protobuf::Value* Find(const google::protobuf::Struct& object, std::string_view key) {
  auto it = object.fields().find(std::string(key));
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

const google::protobuf::Struct* GetObject(const google::protobuf::Struct& object, std::string_view key) {
  const auto* value = Find(object, key);
  if (!value || value->kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  return &value->struct_value();
}

const google::protobuf::ListValue* GetList(const google::protobuf::Struct& object, std::string_view key) {
  const auto* value = Find(object, key);
  if (!value || value->kind_case() != google::protobuf::Value::kListValue) {
    return nullptr;
  }
  return &value->list_value();
}

std::optional<std::string> GetString(const google::protobuf::Struct& object, std::string_view key) {
  const auto* value = Find(object, key);
  if (!value || value->kind_case() != google::protobuf::Value::kStringValue) {
    return std::nullopt;
  }
  return value->string_value();
}

std::optional<double> GetNumber(const google::protobuf::Struct& object, std::string_view key) {
  const auto* value = Find(object, key);
  if (!value || value->kind_case() != google::protobuf::Value::kNumberValue) {
    return std::nullopt;
  }
  return value->number_value();
}

std::optional<uint64_t> GetUnsigned(const google::protobuf::Struct& object, std::string_view key) {
  auto number = GetNumber(object, key);
  if (!number || *number < 0 || !std::isfinite(*number)) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(*number);
}

std::optional<bool> GetBool(const google::protobuf::Struct& object, std::string_view key) {
  const auto* value = Find(object, key);
  if (!value || value->kind_case() != google::protobuf::Value::kBoolValue) {
    return std::nullopt;
  }
  return value->bool_value();
}

std::string ToJson(const google::protobuf::Value& value, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(value, &json, options).ok()) {
    return {};
  }
  if (pretty && !json.empty() && json.back() == '\n') {
    json.pop_back();
  }
  return json;
}

std::string ToJson(const google::protobuf::Struct& object, bool pretty) {
  google::protobuf::Value value;
  *value.mutable_struct_value() = object;
  return ToJson(value, pretty);
}

google::protobuf::Value StringValue(std::string_view text) {
  google::protobuf::Value value;
  value.set_string_value(std::string(text));
  return value;
}

google::protobuf::Value NumberValue(double number) {
  google::protobuf::Value value;
  value.set_number_value(number);
  return value;
}

google::protobuf::Value BoolValue(bool flag) {
  google::protobuf::Value value;
  value.set_bool_value(flag);
  return value;
}

std::string ExtractJsonText(std::string_view text) {
  if (auto block = FencedBlock(text, "```json")) {
    return *block;
  }
  if (auto block = FencedBlock(text, "```")) {
    return *block;
  }
  if (auto object = Enclosed(text, '{', '}')) {
    return *object;
  }
  if (auto array = Enclosed(text, '[', ']')) {
    return *array;
  }
  return std::string(text);
}

} // namespace foreman::util
