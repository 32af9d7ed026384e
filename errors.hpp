#pragma once
#include <string>
#include <system_error>

namespace sonyflake {

enum class SonyflakeErr {
  Ok = 0,
  NoMachineId,
  MachineIdOutOfRange,
  ClockMovedBackwards,
  TimestampOverflow,
};
struct SonyflakeErrCatagory : std::error_category {
  auto name() const noexcept -> char const* override;
  auto message(int ev) const -> std::string override;
  auto equivalent(int code, std::error_condition const& cond) const noexcept -> bool override;
};
auto sonyflakeErrCatagory() -> SonyflakeErrCatagory const&;
auto make_error_code(SonyflakeErr e) -> std::error_code;

// Coarse kinds a caller usually branches on.
enum class SonyflakeErrKind {
  Configuration = 1,
  ClockRegression,
  Overflow,
};
struct SonyflakeErrKindCatagory : std::error_category {
  auto name() const noexcept -> char const* override;
  auto message(int ev) const -> std::string override;
};
auto sonyflakeErrKindCatagory() -> SonyflakeErrKindCatagory const&;
auto make_error_condition(SonyflakeErrKind e) -> std::error_condition;

} // namespace sonyflake

namespace std {
template <>
struct is_error_code_enum<sonyflake::SonyflakeErr> : true_type {};
template <>
struct is_error_condition_enum<sonyflake::SonyflakeErrKind> : true_type {};
} // namespace std
