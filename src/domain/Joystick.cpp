// Joystick.cpp

#include "Joystick.h"

#include <math.h>

static constexpr float kRailSnap = 0.99f;

float Joystick::normalize(int32_t raw) const {
  if (raw <= config_.low) return -1.0f;
  if (raw >= config_.high) return 1.0f;

  const float range = static_cast<float>(config_.high - config_.low);
  const float value = (static_cast<float>(raw - config_.low) * 2.0f) / range - 1.0f;
  if (fabsf(value) < config_.deadzone) return 0.0f;
  if (value >= kRailSnap) return 1.0f;
  if (value <= -kRailSnap) return -1.0f;
  return value;
}
