// AudioOutput.h
// Abstract interface for the speaker the event loop plays tones on.

#pragma once

#include <stdint.h>

class AudioOutput {
 public:
  virtual ~AudioOutput() = default;

  // Powers the amplifier on or off. Implementations should be idempotent.
  virtual void setEnabled(bool on) = 0;

  // Starts a tone that loops until stop() is called.
  virtual void play(uint16_t frequencyHz) = 0;

  virtual void stop() = 0;
};
