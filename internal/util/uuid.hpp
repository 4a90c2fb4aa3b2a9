#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace foreman::util {

/*
  Agent and pipeline ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// fresh v4 id, already formatted
std::string NewId();

} // namespace foreman::util
