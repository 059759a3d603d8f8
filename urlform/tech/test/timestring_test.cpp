#include "urlform/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string_view>

#include "urlform/timedef.hpp"

namespace urlform {

using namespace std::chrono;

TEST(TimeStringIso8601UTCTest, BasicIso8601Format) {
  char buf[kISO8601WithMsStrLen];
  SysTimePoint tp = sys_days{year{2025} / 8 / 14} + hours{12} + minutes{34} + seconds{56} + milliseconds{789};
  char* end = TimeToStringISO8601UTCWithMs(tp, buf);
  EXPECT_EQ(std::string_view(buf, static_cast<std::size_t>(end - buf)), "2025-08-14T12:34:56.789Z");
}

TEST(TimeStringIso8601UTCTest, EpochAndStringOverload) {
  EXPECT_EQ(TimeToStringISO8601UTCWithMs(SysTimePoint{}), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(TimeToStringISO8601UTCWithMs(sys_days{year{2024} / 2 / 29} + hours{6}), "2024-02-29T06:00:00.000Z");
}

TEST(TimeStringIso8601UTCTest, SubMillisecondsTruncated) {
  SysTimePoint tp = sys_days{year{2022} / 1 / 1} + microseconds{1999};
  EXPECT_EQ(TimeToStringISO8601UTCWithMs(tp), "2022-01-01T00:00:00.001Z");
}

TEST(StringToTimeISO8601UTC, PartialForms) {
  EXPECT_EQ(StringToTimeISO8601UTC("2024"), sys_days{year{2024} / 1 / 1});
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03"), sys_days{year{2024} / 3 / 1});
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15"), sys_days{year{2024} / 3 / 15});
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T10"), sys_days{year{2024} / 3 / 15} + hours{10});
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T10:20"), sys_days{year{2024} / 3 / 15} + hours{10} + minutes{20});
}

TEST(StringToTimeISO8601UTC, FullFormWithAndWithoutFraction) {
  const SysTimePoint base = sys_days{year{2024} / 3 / 15} + hours{10} + minutes{20} + seconds{30};
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T10:20:30Z"), base);
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T10:20:30"), base);
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15 10:20:30Z"), base);
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T10:20:30.123Z"), base + milliseconds{123});
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T10:20:30.5Z"), base + milliseconds{500});
}

TEST(StringToTimeISO8601UTC, Offsets) {
  const SysTimePoint utc = sys_days{year{2024} / 3 / 15} + hours{10};
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T12:00:00+02:00"), utc);
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T05:30:00-04:30"), utc);
  EXPECT_EQ(StringToTimeISO8601UTC("2024-03-15T11:00:00.000+0100"), utc);
}

TEST(StringToTimeISO8601UTC, RoundTripWithMs) {
  const SysTimePoint tp = sys_days{year{2023} / 12 / 31} + hours{23} + minutes{59} + seconds{59} + milliseconds{999};
  EXPECT_EQ(StringToTimeISO8601UTC(TimeToStringISO8601UTCWithMs(tp)), tp);
}

TEST(StringToTimeISO8601UTC, Invalid) {
  EXPECT_THROW(StringToTimeISO8601UTC(""), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("20x4"), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2024-13-01"), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2023-02-29"), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2024-03-15T25:00:00Z"), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2024-03-15T10:20:30."), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2024-03-15T10:20:30+2"), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2024-03-15T10:20:30Zjunk"), std::invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("not a date"), std::invalid_argument);
}

}  // namespace urlform
