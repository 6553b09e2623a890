// RingGame.h
// Demo game on a 10-pixel ring: catch the running light when it passes the
// pixel next to button B. Button A arms a new game of ten rounds, each one
// faster than the last, followed by a results screen.

#pragma once

#include <Arduino.h>
#include <FastLED.h>

#include "src/domain/EventLoop.h"

class RingGame {
 public:
  static constexpr uint8_t kPixelCount = 10;
  static constexpr uint8_t kRounds = 10;
  static constexpr uint8_t kTargetPixel = 7;

  // Set up the pixel ring and register button bindings on loop.
  void begin(EventLoop &loop);

  // Entry point handed to EventLoop::run().
  static void start(TimeMs nowMs, void* ctx);

 private:
  EventLoop* loop_ = nullptr;
  CRGB leds_[kPixelCount];

  bool ready_ = false;
  uint8_t round_ = 0;
  uint8_t pos_ = 0;
  uint8_t results_[kRounds] = {};

  HandlerId mainId_ = kNoHandler;
  HandlerId finishId_ = kNoHandler;

  void reset();
  void render();
  void step(TimeMs nowMs);
  void finish();
  Propagation onReady();
  Propagation onCatch();

  static void stepThunk(TimeMs nowMs, void* ctx);
  static void finishThunk(TimeMs nowMs, void* ctx);
  static Propagation readyThunk(TimeMs nowMs, void* ctx);
  static Propagation catchThunk(TimeMs nowMs, void* ctx);
};
