// ArduinoInputs.cpp

#include "ArduinoInputs.h"

#include <stdlib.h>

#include "src/config/BuildConfig.h"
#include "src/config/Pins.h"
#include "src/infrastructure/Logger.h"

// Looks name up in one of the Pins.h tables.
template <size_t N>
static bool lookupPin(const NamedPin (&table)[N], const std::string &name, uint8_t &outPin) {
  for (size_t i = 0; i < N; ++i) {
    if (name == table[i].name) {
      outPin = table[i].pin;
      return true;
    }
  }
  return false;
}

// "D<n>" names address GPIO n directly.
static bool parseDigitalName(const std::string &name, uint8_t &outPin) {
  if (name.size() < 2 || name[0] != 'D') return false;
  char* end = nullptr;
  long n = strtol(name.c_str() + 1, &end, 10);
  if (*end != '\0' || n < 0 || n >= NUM_DIGITAL_PINS) return false;
  outPin = static_cast<uint8_t>(n);
  return true;
}

void TouchPadInput::begin() {
  // Average a few samples for the untouched baseline.
  uint32_t sum = 0;
  const int samples = 8;
  for (int i = 0; i < samples; ++i) {
    sum += touchRead(pin_);
    delay(2);
  }
  const uint32_t baseline = sum / samples;
  threshold_ = baseline * thresholdPercent_ / 100u;
  Logger::debug("Touch: pin %u baseline=%u threshold=%u", (unsigned)pin_, (unsigned)baseline,
                (unsigned)threshold_);
}

void GamepadShiftInput::begin() {
  pinMode(clockPin_, OUTPUT);
  pinMode(latchPin_, OUTPUT);
  pinMode(dataPin_, INPUT);
  digitalWrite(clockPin_, LOW);
  digitalWrite(latchPin_, HIGH);
}

uint8_t GamepadShiftInput::readBits() {
  // Pulse the latch low to load the parallel inputs, then clock them out.
  digitalWrite(latchPin_, LOW);
  delayMicroseconds(5);
  digitalWrite(latchPin_, HIGH);
  return shiftIn(dataPin_, clockPin_, MSBFIRST);
}

std::unique_ptr<DigitalInput> ArduinoInputFactory::createDigital(const std::string &name) {
  uint8_t pin = 0;
  if (!lookupPin(kButtonPins, name, pin) && !parseDigitalName(name, pin)) {
    return std::unique_ptr<DigitalInput>();
  }
  DigitalPinInput* input = new DigitalPinInput(pin);
  input->begin();
  Logger::info("Input: %s on GPIO %u", name.c_str(), (unsigned)pin);
  return std::unique_ptr<DigitalInput>(input);
}

std::unique_ptr<DigitalInput> ArduinoInputFactory::createTouch(const std::string &name) {
  uint8_t pin = 0;
  if (!lookupPin(kTouchPins, name, pin)) return std::unique_ptr<DigitalInput>();
  TouchPadInput* input = new TouchPadInput(pin, BUILD_TOUCH_THRESHOLD_PERCENT);
  input->begin();
  Logger::info("Input: %s touch pad on GPIO %u", name.c_str(), (unsigned)pin);
  return std::unique_ptr<DigitalInput>(input);
}

std::unique_ptr<AnalogInput> ArduinoInputFactory::createAnalog(const std::string &name) {
  uint8_t pin = 0;
  if (!lookupPin(kJoystickPins, name, pin)) return std::unique_ptr<AnalogInput>();
  AnalogPinInput* input = new AnalogPinInput(pin);
  input->begin();
  Logger::info("Input: %s axis on GPIO %u", name.c_str(), (unsigned)pin);
  return std::unique_ptr<AnalogInput>(input);
}

std::unique_ptr<ShiftRegisterInput> ArduinoInputFactory::createGamepad() {
  GamepadShiftInput* input = new GamepadShiftInput(PIN_GAMEPAD_CLOCK, PIN_GAMEPAD_DATA, PIN_GAMEPAD_LATCH);
  input->begin();
  Logger::info("Input: gamepad shift register (clk=%u data=%u latch=%u)", (unsigned)PIN_GAMEPAD_CLOCK,
               (unsigned)PIN_GAMEPAD_DATA, (unsigned)PIN_GAMEPAD_LATCH);
  return std::unique_ptr<ShiftRegisterInput>(input);
}
