// ButtonCatalog.cpp

#include "ButtonCatalog.h"

#include <string.h>

namespace ButtonCatalog {

const GamepadButton kGamepadLayout[] = {
  {"GAMEPAD_A", 0x02},
  {"GAMEPAD_B", 0x01},
  {"GAMEPAD_START", 0x04},
  {"GAMEPAD_SELECT", 0x08},
  {"GAMEPAD_X", 0x10},
  {"GAMEPAD_Y", 0x20},
  {"GAMEPAD_Z", 0x40},
  {"GAMEPAD_R", 0x80},
};
const size_t kGamepadLayoutSize = sizeof(kGamepadLayout) / sizeof(kGamepadLayout[0]);

static bool startsWith(const std::string &s, const char* prefix) {
  return s.compare(0, strlen(prefix), prefix) == 0;
}

// True for a single letter followed by one or more digits, e.g. "A3" or "D12".
static bool isLetterDigits(const std::string &s, char letter) {
  if (s.size() < 2 || s[0] != letter) return false;
  for (size_t i = 1; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

ButtonKind classify(const std::string &name) {
  uint8_t mask = 0;
  if (gamepadMask(name, mask)) return ButtonKind::Gamepad;
  if (isLetterDigits(name, 'A')) return ButtonKind::Touch;
  if (isLetterDigits(name, 'D')) return ButtonKind::Digital;
  if (startsWith(name, "BUTTON_") && name.size() > strlen("BUTTON_")) return ButtonKind::Digital;
  return ButtonKind::Unknown;
}

bool gamepadMask(const std::string &name, uint8_t &outMask) {
  for (size_t i = 0; i < kGamepadLayoutSize; ++i) {
    if (name == kGamepadLayout[i].name) {
      outMask = kGamepadLayout[i].mask;
      return true;
    }
  }
  return false;
}

bool isJoystickAxis(const std::string &name) {
  return startsWith(name, "JOYSTICK_") && name.size() > strlen("JOYSTICK_");
}

const char* kindName(ButtonKind kind) {
  switch (kind) {
    case ButtonKind::Digital: return "digital";
    case ButtonKind::Touch: return "touch";
    case ButtonKind::Gamepad: return "gamepad";
    case ButtonKind::Unknown: break;
  }
  return "unknown";
}

}  // namespace ButtonCatalog
