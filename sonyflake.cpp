#include "sonyflake.hpp"

#include <thread>

namespace sonyflake {

Sonyflake::Sonyflake(Token, SonyflakeOption const& option, std::uint64_t machineId)
    : mStartTime(option.startTime), mStartMillis(option.startTime.time_since_epoch().count()),
      mMachineId(machineId), mClock(option.clock ? option.clock : systemClock()), mYieldOnWait(option.yieldOnWait)
{
}

auto Sonyflake::create(SonyflakeOption const& option) -> ext::expected<std::unique_ptr<Sonyflake>, std::error_code>
{
  auto machineId = option.machineId;
  auto resolved = false;
  if (!machineId && option.machineIdResolver) {
    machineId = option.machineIdResolver();
    resolved = true;
  }
  if (!machineId) {
    spdlog::error("sonyflake: cannot determine machine id");
    return ext::make_unexpected(SonyflakeErr::NoMachineId);
  }
  if (*machineId < 0 || static_cast<std::uint64_t>(*machineId) > kMachineIdMask) {
    spdlog::error("sonyflake: machine id {} out of range [0, {}]", *machineId, kMachineIdMask);
    return ext::make_unexpected(SonyflakeErr::MachineIdOutOfRange);
  }
  auto generator = std::make_unique<Sonyflake>(Token(), option, static_cast<std::uint64_t>(*machineId));
  spdlog::debug("sonyflake: machine id {} ({}), epoch {}ms", *machineId, resolved ? "resolved" : "configured",
               generator->mStartMillis);
  return std::move(generator);
}

auto Sonyflake::elapsedTicks() const -> ext::expected<std::int64_t, std::error_code>
{
  // Truncates toward zero.
  auto ticks = (mClock() - mStartMillis) / kTickMillis;
  if (ticks > static_cast<std::int64_t>(kTimestampMask)) {
    spdlog::error("sonyflake: tick {} exceeds {} bit timestamp", ticks, kTimestampBits);
    return ext::make_unexpected(SonyflakeErr::TimestampOverflow);
  }
  return ticks;
}

auto Sonyflake::next() -> ext::expected<std::uint64_t, std::error_code>
{
  auto lk = std::scoped_lock(mMutex);

  auto elapsed = elapsedTicks();
  if (!elapsed) {
    return ext::make_unexpected(elapsed.error());
  }
  auto timestamp = *elapsed;
  if (timestamp < mLastTimestamp) {
    spdlog::warn("sonyflake: clock moved backwards, tick {} < last tick {}", timestamp, mLastTimestamp);
    return ext::make_unexpected(SonyflakeErr::ClockMovedBackwards);
  }

  auto sequence = std::uint64_t(0);
  if (timestamp == mLastTimestamp) {
    sequence = (mSequence + 1) & kSequenceMask;
    if (sequence == 0) {
      spdlog::debug("sonyflake: sequence exhausted in tick {}, waiting", mLastTimestamp);
      while (timestamp <= mLastTimestamp) {
        if (mYieldOnWait) {
          std::this_thread::yield();
        }
        elapsed = elapsedTicks();
        if (!elapsed) {
          return ext::make_unexpected(elapsed.error());
        }
        timestamp = *elapsed;
      }
    }
  }

  mSequence = sequence;
  mLastTimestamp = timestamp;
  return (static_cast<std::uint64_t>(timestamp) << kTimestampShift) | (sequence << kSequenceShift) | mMachineId;
}

auto Sonyflake::parse(std::uint64_t id) const -> IdPayload
{
  auto timestamp = (id >> kTimestampShift) * kTickMillis;
  return IdPayload{
      .timestamp = timestamp,
      .sequence = (id >> kSequenceShift) & kSequenceMask,
      .machineId = id & kMachineIdMask,
      .startTime = mStartTime,
      .generatedTime = mStartTime + std::chrono::milliseconds(timestamp),
  };
}

namespace {
std::mutex gDefaultMutex;
std::shared_ptr<Sonyflake> gDefault;

auto defaultInstance() -> ext::expected<std::shared_ptr<Sonyflake>, std::error_code>
{
  auto lk = std::scoped_lock(gDefaultMutex);
  if (!gDefault) {
    auto created = Sonyflake::create();
    if (!created) {
      return ext::make_unexpected(created.error());
    }
    gDefault = std::move(*created);
  }
  return gDefault;
}
} // namespace

auto set(SonyflakeOption const& option) -> std::error_code
{
  auto created = Sonyflake::create(option);
  if (!created) {
    return created.error();
  }
  auto lk = std::scoped_lock(gDefaultMutex);
  gDefault = std::move(*created);
  return SonyflakeErr::Ok;
}

auto next() -> ext::expected<std::uint64_t, std::error_code>
{
  auto instance = defaultInstance();
  if (!instance) {
    return ext::make_unexpected(instance.error());
  }
  return (*instance)->next();
}

auto parse(std::uint64_t id) -> ext::expected<IdPayload, std::error_code>
{
  auto instance = defaultInstance();
  if (!instance) {
    return ext::make_unexpected(instance.error());
  }
  return (*instance)->parse(id);
}

} // namespace sonyflake
