// Joystick.h
// Normalizes raw joystick axis readings to [-1, 1].

#pragma once

#include <stdint.h>

struct JoystickConfig {
  float deadzone = 0.1f;  // |value| below this reads as centered
  int32_t low = 0;        // raw reading at full negative deflection
  int32_t high = 65536;   // raw reading at full positive deflection
};

class Joystick {
 public:
  explicit Joystick(const JoystickConfig &config = JoystickConfig()) : config_(config) {}

  // Clamp to the rails, rescale linearly, then snap values inside the deadzone
  // to 0.0 and values beyond +/-0.99 to exactly +/-1.0.
  float normalize(int32_t raw) const;

  const JoystickConfig &config() const { return config_; }

 private:
  JoystickConfig config_;
};
