#pragma once

#include <cstdint>
#include <string>

namespace foreman::db::model {

/*
  Persisted OutputEvent. parsed_json holds the raw payload as JSON text
  (empty when the event carried none).
*/
struct OutputRecord {
  int64_t     id = 0;
  std::string agent_id;
  std::string pipeline_id;
  std::string session_id;
  std::string output_type;
  std::string content;
  std::string parsed_json;
  uint64_t    byte_size    = 0;
  int64_t     timestamp_ms = 0;
};

// Exactly one of agent_id / pipeline_id is expected to be set.
struct OutputQuery {
  std::string agent_id;
  std::string pipeline_id;
  uint32_t    limit = 0; // most recent N, 0 = all
};

} // namespace foreman::db::model
