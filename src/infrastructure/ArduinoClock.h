// ArduinoClock.h
// Monotonic millisecond clock on top of Arduino millis()/delay().

#pragma once

#include <Arduino.h>

#include "src/domain/Clock.h"

class ArduinoClock : public Clock {
 public:
  // Extends the 32-bit millis() counter to 64 bits. Must be called at least
  // once every ~49 days, which the event loop does on every pass.
  TimeMs nowMs() override;

  void sleepMs(TimeMs durationMs) override;

 private:
  uint32_t lastMillis_ = 0;
  uint64_t rollovers_ = 0;
};
