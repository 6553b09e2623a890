// ButtonCatalog.h
// Classifies logical button identifiers into the kind of driver that backs
// them, and holds the fixed gamepad bit layout.
//
//   GAMEPAD_<NAME>        bit of the gamepad shift register (see kGamepadLayout)
//   A<digits>             capacitive touch pad on an analog-capable pin
//   D<digits>, BUTTON_*   discrete digital pin
//   JOYSTICK_<NAME>       analog joystick axis (not a button)

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

enum class ButtonKind {
  Unknown,
  Digital,
  Touch,
  Gamepad,
};

struct GamepadButton {
  const char* name;
  uint8_t mask;
};

namespace ButtonCatalog {

// Decode order of the gamepad word; also the order gamepad buttons appear in
// an input snapshot.
extern const GamepadButton kGamepadLayout[];
extern const size_t kGamepadLayoutSize;

ButtonKind classify(const std::string &name);

// Looks up the shift-register mask of a gamepad button. Returns false for
// names outside the layout.
bool gamepadMask(const std::string &name, uint8_t &outMask);

bool isJoystickAxis(const std::string &name);

const char* kindName(ButtonKind kind);

}  // namespace ButtonCatalog
