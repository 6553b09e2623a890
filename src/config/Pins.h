// Pins.h
// Logical pin mapping for an ESP32 game board. Adjust to your hardware.
// Names used in bindings resolve through these tables; D<n> maps straight to GPIO n.

#pragma once

#include <stdint.h>

struct NamedPin {
  const char* name;
  uint8_t pin;
};

// Discrete push buttons (pull-down, active HIGH).
static const NamedPin kButtonPins[] = {
  {"BUTTON_A", 4},
  {"BUTTON_B", 5},
};

// Capacitive touch pads, named after the board's analog-capable pins.
// ESP32 touch channels: T2=GPIO2, T3=GPIO15, T4=GPIO13, T5=GPIO12, T6=GPIO14, T7=GPIO27.
static const NamedPin kTouchPins[] = {
  {"A1", 2},
  {"A2", 15},
  {"A3", 13},
  {"A4", 12},
  {"A5", 14},
  {"A6", 27},
};

// Joystick axes on ADC1 pins (ADC2 is unusable while WiFi is on).
static const NamedPin kJoystickPins[] = {
  {"JOYSTICK_X", 34},
  {"JOYSTICK_Y", 35},
};

// 74HC165 gamepad shift register.
#ifndef PIN_GAMEPAD_CLOCK
#define PIN_GAMEPAD_CLOCK 18
#endif
#ifndef PIN_GAMEPAD_DATA
#define PIN_GAMEPAD_DATA 19
#endif
#ifndef PIN_GAMEPAD_LATCH
#define PIN_GAMEPAD_LATCH 23
#endif

// Piezo/amplifier output and amplifier shutdown control.
#ifndef PIN_SPEAKER
#define PIN_SPEAKER 25
#endif
#ifndef PIN_SPEAKER_ENABLE
#define PIN_SPEAKER_ENABLE 26
#endif

// NeoPixel ring data line.
#ifndef PIN_NEOPIXEL
#define PIN_NEOPIXEL 21
#endif
