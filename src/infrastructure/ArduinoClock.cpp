// ArduinoClock.cpp

#include "ArduinoClock.h"

TimeMs ArduinoClock::nowMs() {
  const uint32_t m = millis();
  if (m < lastMillis_) rollovers_++;
  lastMillis_ = m;
  return (rollovers_ << 32) | m;
}

void ArduinoClock::sleepMs(TimeMs durationMs) {
  // delay() takes 32 bits; the loop re-checks and sleeps off any remainder.
  const uint32_t ms = durationMs > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<uint32_t>(durationMs);
  delay(ms);
}
