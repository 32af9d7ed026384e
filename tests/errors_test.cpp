#include "../errors.hpp"
#include <gtest/gtest.h>

using namespace sonyflake;

TEST(Errors, Message)
{
  std::error_code ec = SonyflakeErr::ClockMovedBackwards;
  ASSERT_STREQ(ec.category().name(), "SonyflakeError");
  ASSERT_EQ(ec.message(), "clock moved backwards, refusing to generate id");
  ASSERT_FALSE(std::error_code(SonyflakeErr::Ok));
}

TEST(Errors, Kind)
{
  ASSERT_TRUE(std::error_code(SonyflakeErr::NoMachineId) == SonyflakeErrKind::Configuration);
  ASSERT_TRUE(std::error_code(SonyflakeErr::MachineIdOutOfRange) == SonyflakeErrKind::Configuration);
  ASSERT_TRUE(std::error_code(SonyflakeErr::ClockMovedBackwards) == SonyflakeErrKind::ClockRegression);
  ASSERT_TRUE(std::error_code(SonyflakeErr::TimestampOverflow) == SonyflakeErrKind::Overflow);
  ASSERT_FALSE(std::error_code(SonyflakeErr::TimestampOverflow) == SonyflakeErrKind::Configuration);
  ASSERT_FALSE(std::error_code(SonyflakeErr::Ok) == SonyflakeErrKind::Configuration);
  ASSERT_EQ(std::error_condition(SonyflakeErrKind::Overflow).message(), "OverflowError");
}
