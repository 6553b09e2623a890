// ArduinoInputs.h
// Arduino-backed input drivers and the factory the input router uses to
// create them from logical button and axis names.

#pragma once

#include <Arduino.h>

#include <memory>
#include <string>

#include "src/domain/InputDevices.h"

// Push button on a GPIO with the internal pull-down enabled; HIGH reads as down.
class DigitalPinInput : public DigitalInput {
 public:
  explicit DigitalPinInput(uint8_t pin) : pin_(pin) {}

  void begin() { pinMode(pin_, INPUT_PULLDOWN); }

  bool read() override { return digitalRead(pin_) == HIGH; }

 private:
  uint8_t pin_;
};

// Capacitive touch pad. The untouched baseline is sampled in begin(), so the
// pad must not be touched during startup.
class TouchPadInput : public DigitalInput {
 public:
  TouchPadInput(uint8_t pin, uint8_t thresholdPercent)
      : pin_(pin), thresholdPercent_(thresholdPercent) {}

  void begin();

  bool read() override { return touchRead(pin_) < threshold_; }

 private:
  uint8_t pin_;
  uint8_t thresholdPercent_;
  uint32_t threshold_ = 0;
};

class AnalogPinInput : public AnalogInput {
 public:
  explicit AnalogPinInput(uint8_t pin) : pin_(pin) {}

  void begin() { pinMode(pin_, INPUT); }

  uint16_t read() override { return static_cast<uint16_t>(analogRead(pin_)); }

 private:
  uint8_t pin_;
};

// 8 buttons behind a 74HC165 parallel-in/serial-out shift register.
class GamepadShiftInput : public ShiftRegisterInput {
 public:
  GamepadShiftInput(uint8_t clockPin, uint8_t dataPin, uint8_t latchPin)
      : clockPin_(clockPin), dataPin_(dataPin), latchPin_(latchPin) {}

  void begin();

  uint8_t readBits() override;

 private:
  uint8_t clockPin_;
  uint8_t dataPin_;
  uint8_t latchPin_;
};

class ArduinoInputFactory : public InputDeviceFactory {
 public:
  std::unique_ptr<DigitalInput> createDigital(const std::string &name) override;
  std::unique_ptr<DigitalInput> createTouch(const std::string &name) override;
  std::unique_ptr<AnalogInput> createAnalog(const std::string &name) override;
  std::unique_ptr<ShiftRegisterInput> createGamepad() override;
};
