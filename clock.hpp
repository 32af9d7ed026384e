#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace sonyflake {

// Milliseconds since the Unix epoch.
using Clock = std::function<std::int64_t()>;

inline auto nowMillis() -> std::int64_t
{
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline auto systemClock() -> Clock { return nowMillis; }

} // namespace sonyflake
