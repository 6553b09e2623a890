// Clock.h
// Abstract interface for the monotonic time source and the blocking wait.

#pragma once

#include "src/domain/Types.h"

class Clock {
 public:
  virtual ~Clock() = default;

  // Returns milliseconds since an arbitrary fixed origin. Never goes backwards.
  virtual TimeMs nowMs() = 0;

  // Blocks for roughly durationMs. May return early or late; callers re-check.
  virtual void sleepMs(TimeMs durationMs) = 0;
};
