// ToneSpeaker.h
// Square-wave tone output on a piezo or small amplifier, with an optional
// amplifier enable pin. Tones loop until stop().

#pragma once

#include <Arduino.h>

#include "src/domain/AudioOutput.h"

class ToneSpeaker : public AudioOutput {
 public:
  // enablePin of 255 means the amplifier is always on.
  ToneSpeaker(uint8_t speakerPin, uint8_t enablePin) : speakerPin_(speakerPin), enablePin_(enablePin) {}

  // Configure pins and leave the amplifier off.
  void begin();

  void setEnabled(bool on) override;
  void play(uint16_t frequencyHz) override;
  void stop() override;

  bool isEnabled() const { return enabled_; }

 private:
  uint8_t speakerPin_;
  uint8_t enablePin_;
  bool enabled_ = false;
};
