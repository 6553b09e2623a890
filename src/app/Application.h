// Application.h
// High-level composition root for the PlayLoop firmware. Responsible for
// initializing subsystems (logging, input drivers, speaker, game) and running
// the event loop.

#pragma once

#include <Arduino.h>

#include "src/app/RingGame.h"
#include "src/config/BuildConfig.h"
#include "src/config/Pins.h"
#include "src/domain/EventLoop.h"
#include "src/infrastructure/ArduinoClock.h"
#include "src/infrastructure/ArduinoInputs.h"
#include "src/infrastructure/Logger.h"
#include "src/infrastructure/ToneSpeaker.h"

class Application {
 public:
  Application();

  // Initializes logging, hardware and the game.
  // Safe to call only once from Arduino setup().
  void begin();

  // Runs the event loop. It blocks until the loop stops; after that every
  // call just idles, since a stopped loop cannot be restarted.
  void runLoop();

 private:
  bool initialized_ = false;  // Tracks whether begin() was called

  ArduinoClock clock_;
  ArduinoInputFactory inputs_;
  ToneSpeaker speaker_;
  EventLoop loop_;
  RingGame game_;

  // Internal helpers
  void initializeLogger();
  void initializeJoystick();
  void initializeSpeaker();

  static JoystickConfig joystickConfig();
  static void writeSerial(const char* line, void* ctx);
};
