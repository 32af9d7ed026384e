#pragma once

#include "clock.hpp"
#include "machine_id.hpp"

#include <chrono>
#include <optional>

namespace sonyflake {

using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// 2014-09-01T00:00:00Z
constexpr std::int64_t kDefaultEpochMillis = 1409529600000;
constexpr auto kDefaultStartTime = TimePoint(std::chrono::milliseconds(kDefaultEpochMillis));

struct SonyflakeOption {
  TimePoint startTime = kDefaultStartTime;
  std::optional<std::int64_t> machineId = std::nullopt;
  Clock clock = systemClock();
  MachineIdResolver machineIdResolver = machineIdByIp;
  bool yieldOnWait = false;
};

} // namespace sonyflake
