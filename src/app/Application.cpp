// Application.cpp
// See Application.h for high-level responsibilities.

#include "Application.h"

static constexpr uint32_t kStoppedIdleMs = 1000;

Application::Application()
    : speaker_(PIN_SPEAKER, PIN_SPEAKER_ENABLE),
      loop_(clock_, inputs_, BUILD_INPUT_POLL_INTERVAL_MS, joystickConfig()) {}

void Application::begin() {
  if (initialized_) return;

  initializeLogger();

  initializeJoystick();

  initializeSpeaker();

  game_.begin(loop_);

  Logger::info("Application initialized. Input poll every %ums", (unsigned)BUILD_INPUT_POLL_INTERVAL_MS);
  initialized_ = true;
}

void Application::runLoop() {
  if (!initialized_) return;

  if (!loop_.isStopped()) {
    loop_.run(&RingGame::start, &game_);
    return;
  }

  delay(kStoppedIdleMs);
}

JoystickConfig Application::joystickConfig() {
  JoystickConfig c;
  c.deadzone = BUILD_JOYSTICK_DEADZONE;
  c.low = BUILD_JOYSTICK_RAW_LOW;
  c.high = BUILD_JOYSTICK_RAW_HIGH;
  return c;
}

void Application::writeSerial(const char* line, void*) {
  Serial.println(line);
}

void Application::initializeLogger() {
  // Initialize Serial with a reasonable baud rate for logs.
  Serial.begin(BUILD_LOG_BAUD_RATE);
  const uint32_t start = millis();
  while (!Serial && millis() - start < 1500) {
    // Wait briefly for Serial on boards that require it; timeout to avoid boot stalls.
    delay(10);
  }
  Logger::setSink(&Application::writeSerial);
  Logger::setLevel(static_cast<LogLevel>(BUILD_LOG_LEVEL));
  Logger::info("Logger initialized (baud=%d)", BUILD_LOG_BAUD_RATE);
}

void Application::initializeJoystick() {
  for (const NamedPin &axis : kJoystickPins) {
    if (!loop_.attachAxis(axis.name)) {
      Logger::warn("Joystick: axis %s unavailable", axis.name);
    }
  }
}

void Application::initializeSpeaker() {
#if BUILD_ENABLE_SPEAKER
  speaker_.begin();
  loop_.attachSpeaker(&speaker_);
#else
  Logger::info("Speaker disabled at build time");
#endif
}
