#pragma once

#include <cstdint>

namespace foreman::util {

/*
  Run history, notifications and pipeline timestamps are unix milliseconds
  taken from the system clock. Durations use steady_clock at the call site.
*/

int64_t NowMillis();

} // namespace foreman::util
