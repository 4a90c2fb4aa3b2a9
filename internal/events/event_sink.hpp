#pragma once

#include <google/protobuf/struct.pb.h>

#include <string_view>

namespace foreman::events {

/*
  Where supervisor and pipeline notifications go ("agent:output",
  "auto_pipeline:completed", ...). Emit must not block on slow consumers.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Emit(std::string_view name, google::protobuf::Struct payload) = 0;
};

} // namespace foreman::events
