#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>

namespace foreman::util {

/*
  JSON helpers on top of google.protobuf.Struct / Value.

  Every accessor tolerates a missing key or a value of the wrong kind and
  returns nullopt / nullptr instead.
*/

// Parses a JSON object. Anything else (plain text, arrays, scalars) is nullopt.
std::optional<google::protobuf::Struct> ParseObject(std::string_view text);

// Parses any JSON document.
std::optional<google::protobuf::Value> ParseValue(std::string_view text);

const google::protobuf::Value*     Find(const google::protobuf::Struct& object, std::string_view key);
const google::protobuf::Struct*    GetObject(const google::protobuf::Struct& object, std::string_view key);
const google::protobuf::ListValue* GetList(const google::protobuf::Struct& object, std::string_view key);

std::optional<std::string> GetString(const google::protobuf::Struct& object, std::string_view key);
std::optional<double>      GetNumber(const google::protobuf::Struct& object, std::string_view key);
std::optional<uint64_t>    GetUnsigned(const google::protobuf::Struct& object, std::string_view key);
std::optional<bool>        GetBool(const google::protobuf::Struct& object, std::string_view key);

std::string ToJson(const google::protobuf::Value& value, bool pretty = false);
std::string ToJson(const google::protobuf::Struct& object, bool pretty = false);

google::protobuf::Value StringValue(std::string_view text);
google::protobuf::Value NumberValue(double number);
google::protobuf::Value BoolValue(bool flag);

/*
  Pulls a JSON document out of free text written by a worker:
    ```json fenced block, then any fenced block, then the outermost {...},
    then the outermost [...]; otherwise the text unchanged.
*/
std::string ExtractJsonText(std::string_view text);

} // namespace foreman::util
