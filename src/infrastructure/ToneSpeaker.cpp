// ToneSpeaker.cpp

#include "ToneSpeaker.h"

#include "src/infrastructure/Logger.h"

static constexpr uint8_t kNoPin = 255;

void ToneSpeaker::begin() {
  pinMode(speakerPin_, OUTPUT);
  if (enablePin_ != kNoPin) pinMode(enablePin_, OUTPUT);
  setEnabled(false);
}

void ToneSpeaker::setEnabled(bool on) {
  enabled_ = on;
  if (enablePin_ != kNoPin) digitalWrite(enablePin_, on ? HIGH : LOW);
  if (!on) noTone(speakerPin_);
}

void ToneSpeaker::play(uint16_t frequencyHz) {
  if (frequencyHz == 0) {
    stop();
    return;
  }
  if (!enabled_) Logger::debug("Speaker: playing %u Hz while disabled", (unsigned)frequencyHz);
  tone(speakerPin_, frequencyHz);
}

void ToneSpeaker::stop() {
  noTone(speakerPin_);
}
