#include "errors.hpp"

namespace sonyflake {

auto SonyflakeErrCatagory::name() const noexcept -> char const* { return "SonyflakeError"; }
auto SonyflakeErrCatagory::message(int ev) const -> std::string
{
  switch (static_cast<SonyflakeErr>(ev)) {
  case SonyflakeErr::Ok:
    return "Ok";
  case SonyflakeErr::NoMachineId:
    return "cannot determine machine id";
  case SonyflakeErr::MachineIdOutOfRange:
    return "machine id out of range";
  case SonyflakeErr::ClockMovedBackwards:
    return "clock moved backwards, refusing to generate id";
  case SonyflakeErr::TimestampOverflow:
    return "timestamp component exceeds storage capacity";
  default:
    return "Unknown";
  }
}
auto SonyflakeErrCatagory::equivalent(int code, std::error_condition const& cond) const noexcept -> bool
{
  if (cond.category() != sonyflakeErrKindCatagory()) {
    return std::error_category::equivalent(code, cond);
  }
  switch (static_cast<SonyflakeErr>(code)) {
  case SonyflakeErr::NoMachineId:
  case SonyflakeErr::MachineIdOutOfRange:
    return cond.value() == static_cast<int>(SonyflakeErrKind::Configuration);
  case SonyflakeErr::ClockMovedBackwards:
    return cond.value() == static_cast<int>(SonyflakeErrKind::ClockRegression);
  case SonyflakeErr::TimestampOverflow:
    return cond.value() == static_cast<int>(SonyflakeErrKind::Overflow);
  default:
    return false;
  }
}
auto sonyflakeErrCatagory() -> SonyflakeErrCatagory const&
{
  static SonyflakeErrCatagory catagory;
  return catagory;
}
auto make_error_code(SonyflakeErr e) -> std::error_code { return {static_cast<int>(e), sonyflakeErrCatagory()}; }

auto SonyflakeErrKindCatagory::name() const noexcept -> char const* { return "SonyflakeErrorKind"; }
auto SonyflakeErrKindCatagory::message(int ev) const -> std::string
{
  switch (static_cast<SonyflakeErrKind>(ev)) {
  case SonyflakeErrKind::Configuration:
    return "ConfigurationError";
  case SonyflakeErrKind::ClockRegression:
    return "ClockRegressionError";
  case SonyflakeErrKind::Overflow:
    return "OverflowError";
  default:
    return "Unknown";
  }
}
auto sonyflakeErrKindCatagory() -> SonyflakeErrKindCatagory const&
{
  static SonyflakeErrKindCatagory catagory;
  return catagory;
}
auto make_error_condition(SonyflakeErrKind e) -> std::error_condition
{
  return {static_cast<int>(e), sonyflakeErrKindCatagory()};
}

} // namespace sonyflake
