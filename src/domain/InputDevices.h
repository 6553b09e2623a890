// InputDevices.h
// Abstract interfaces for the raw input drivers the router polls, and the
// factory that creates them on first use of a logical button or axis.

#pragma once

#include <stdint.h>

#include <memory>
#include <string>

class DigitalInput {
 public:
  virtual ~DigitalInput() = default;

  // Returns true while the button or pad reads as down.
  virtual bool read() = 0;
};

class AnalogInput {
 public:
  virtual ~AnalogInput() = default;

  // Returns the raw reading in the device-defined range.
  virtual uint16_t read() = 0;
};

// Packed multi-button input, e.g. a parallel-in shift register behind a gamepad.
class ShiftRegisterInput {
 public:
  virtual ~ShiftRegisterInput() = default;

  // Returns the bitmask of buttons currently down.
  virtual uint8_t readBits() = 0;
};

class InputDeviceFactory {
 public:
  virtual ~InputDeviceFactory() = default;

  // Each returns nullptr when the board has no input under that name.
  virtual std::unique_ptr<DigitalInput> createDigital(const std::string &name) = 0;
  virtual std::unique_ptr<DigitalInput> createTouch(const std::string &name) = 0;
  virtual std::unique_ptr<AnalogInput> createAnalog(const std::string &name) = 0;
  virtual std::unique_ptr<ShiftRegisterInput> createGamepad() = 0;
};
