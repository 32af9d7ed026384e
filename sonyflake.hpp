#pragma once

#include "errors.hpp"
#include "option.hpp"
#include "preclude.hpp"

#include <memory>
#include <mutex>

namespace sonyflake {

constexpr std::uint64_t kTimestampBits = 39;
constexpr std::uint64_t kSequenceBits = 8;
constexpr std::uint64_t kMachineIdBits = 16;

constexpr std::uint64_t kTimestampShift = kSequenceBits + kMachineIdBits;
constexpr std::uint64_t kSequenceShift = kMachineIdBits;

constexpr std::uint64_t kTimestampMask = (1ull << kTimestampBits) - 1;
constexpr std::uint64_t kSequenceMask = (1ull << kSequenceBits) - 1;
constexpr std::uint64_t kMachineIdMask = (1ull << kMachineIdBits) - 1;

// One timestamp tick.
constexpr std::int64_t kTickMillis = 10;

struct IdPayload {
  std::uint64_t timestamp; // milliseconds since startTime
  std::uint64_t sequence;
  std::uint64_t machineId;
  TimePoint startTime;
  TimePoint generatedTime;
};

// Sonyflake layout, high to low: [39 bit tick | 8 bit sequence | 16 bit machine id].
// next() is serialized by an internal mutex; parse() only reads immutable state.
class Sonyflake {
  // Restricts construction to create(), which validates the machine id.
  struct Token {
    explicit Token() = default;
  };

public:
  Sonyflake(Token, SonyflakeOption const& option, std::uint64_t machineId);
  Sonyflake(Sonyflake const&) = delete;
  Sonyflake& operator=(Sonyflake const&) = delete;

  static auto create(SonyflakeOption const& option = {}) -> ext::expected<std::unique_ptr<Sonyflake>, std::error_code>;

  // Fails with ClockMovedBackwards if the clock is behind the last minted tick,
  // or TimestampOverflow once the tick count no longer fits in 39 bits.
  // Spins until the next tick when the sequence is exhausted.
  auto next() -> ext::expected<std::uint64_t, std::error_code>;
  auto parse(std::uint64_t id) const -> IdPayload;

  auto machineId() const -> std::uint64_t { return mMachineId; }
  auto startTime() const -> TimePoint { return mStartTime; }

private:
  auto elapsedTicks() const -> ext::expected<std::int64_t, std::error_code>;

private:
  TimePoint mStartTime;
  std::int64_t mStartMillis;
  std::uint64_t mMachineId;
  Clock mClock;
  bool mYieldOnWait;

  std::mutex mMutex;
  std::int64_t mLastTimestamp = 0;
  std::uint64_t mSequence = 0;
};

// Process-wide default instance, created with default options on first use.
// Creation and replacement are serialized; callers of next()/parse() keep the
// instance they started with alive across a concurrent set().
auto set(SonyflakeOption const& option) -> std::error_code;
auto next() -> ext::expected<std::uint64_t, std::error_code>;
auto parse(std::uint64_t id) -> ext::expected<IdPayload, std::error_code>;

} // namespace sonyflake
