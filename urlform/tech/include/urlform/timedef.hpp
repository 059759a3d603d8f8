#pragma once

#include <chrono>

namespace urlform {

/// The date leaf type of the codec.
/// system_clock is the only clock guaranteed to provide conversions to Unix epoch time.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

}  // namespace urlform
