// BuildConfig.h
// Central build-time configuration. Every value can be overridden with -D.

#pragma once

#ifndef BUILD_LOG_BAUD_RATE
#define BUILD_LOG_BAUD_RATE 115200
#endif

// 0=ERROR, 1=WARN, 2=INFO, 3=DEBUG (see LogLevel in Logger.h)
#ifndef BUILD_LOG_LEVEL
#define BUILD_LOG_LEVEL 2
#endif

// How often the event loop polls buttons, touch pads, the gamepad and the
// joystick. 20ms keeps input responsive without burning the CPU.
#ifndef BUILD_INPUT_POLL_INTERVAL_MS
#define BUILD_INPUT_POLL_INTERVAL_MS 20
#endif

// Joystick normalization. Raw readings are clamped to [LOW, HIGH] and scaled
// to [-1, 1]; magnitudes below DEADZONE read as centered.
#ifndef BUILD_JOYSTICK_DEADZONE
#define BUILD_JOYSTICK_DEADZONE 0.1f
#endif
#ifndef BUILD_JOYSTICK_RAW_LOW
#define BUILD_JOYSTICK_RAW_LOW 0
#endif
// ESP32 ADC is 12-bit by default.
#ifndef BUILD_JOYSTICK_RAW_HIGH
#define BUILD_JOYSTICK_RAW_HIGH 4095
#endif

// A pad counts as touched when its reading drops below this percentage of
// the baseline captured at startup.
#ifndef BUILD_TOUCH_THRESHOLD_PERCENT
#define BUILD_TOUCH_THRESHOLD_PERCENT 80
#endif

#ifndef BUILD_ENABLE_SPEAKER
#define BUILD_ENABLE_SPEAKER 1
#endif
