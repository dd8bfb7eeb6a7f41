#pragma once

#include <stdint.h>

// Time source for the scheduler, injectable so cycles can be driven without
// waiting for real intervals.
class StationClock {
 public:
  virtual ~StationClock() = default;

  // Monotonic milliseconds; may wrap.
  virtual uint32_t nowMs() = 0;

  virtual void sleepMs(uint32_t ms) = 0;
};
