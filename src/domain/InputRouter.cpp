// InputRouter.cpp

#include "InputRouter.h"

#include <algorithm>

#include "src/infrastructure/Logger.h"

static bool containsName(const std::vector<std::string> &names, const std::string &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

static bool containsAll(const std::vector<std::string> &haystack, const std::vector<std::string> &needles) {
  for (const std::string &n : needles) {
    if (!containsName(haystack, n)) return false;
  }
  return true;
}

InputRouter::InputRouter(InputDeviceFactory &devices, const JoystickConfig &joystick)
    : devices_(devices), joystick_(joystick) {}

bool InputRouter::bind(HandlerId id, const std::vector<std::string> &buttons, ButtonAction action,
                       ButtonCallback fn, void* ctx) {
  if (!fn) {
    Logger::error("Input: binding %u has no handler; rejected", (unsigned)id);
    return false;
  }
  if (buttons.empty()) {
    Logger::error("Input: binding %u has no buttons; rejected", (unsigned)id);
    return false;
  }
  for (size_t i = 0; i < buttons.size(); ++i) {
    for (size_t j = i + 1; j < buttons.size(); ++j) {
      if (buttons[i] == buttons[j]) {
        Logger::error("Input: binding %u lists %s twice; rejected", (unsigned)id, buttons[i].c_str());
        return false;
      }
    }
  }

  for (const std::string &name : buttons) setupButton(name);

  const Binding binding{id, buttons, action, fn, ctx, false};
  Binding* existing = findBinding(id);
  if (existing && dispatching_) {
    for (Binding &p : pendingReplacements_) {
      if (p.id == id) {
        p = binding;
        return true;
      }
    }
    pendingReplacements_.push_back(binding);
  } else if (existing) {
    *existing = binding;
  } else {
    bindings_.push_back(binding);
  }
  Logger::debug("Input: binding %u %s (%u button(s), %s)", (unsigned)id,
                existing ? "replaced" : "registered", (unsigned)buttons.size(),
                action == ButtonAction::Pressed ? "pressed" : "released");
  return true;
}

bool InputRouter::cancel(HandlerId id) {
  for (auto it = pendingReplacements_.begin(); it != pendingReplacements_.end(); ++it) {
    if (it->id == id) {
      pendingReplacements_.erase(it);
      break;
    }
  }
  for (auto it = bindings_.begin(); it != bindings_.end(); ++it) {
    if (it->id != id || it->removed) continue;
    if (dispatching_) {
      it->removed = true;
    } else {
      bindings_.erase(it);
    }
    return true;
  }
  return false;
}

size_t InputRouter::bindingCount() const {
  size_t n = 0;
  for (const Binding &b : bindings_) {
    if (!b.removed) n++;
  }
  return n;
}

InputRouter::Binding* InputRouter::findBinding(HandlerId id) {
  for (Binding &b : bindings_) {
    if (b.id == id && !b.removed) return &b;
  }
  return nullptr;
}

bool InputRouter::attachAxis(const std::string &name) {
  for (const Axis &a : axes_) {
    if (a.name == name) return true;
  }
  if (!ButtonCatalog::isJoystickAxis(name)) {
    Logger::warn("Input: %s is not a joystick axis", name.c_str());
    return false;
  }
  std::unique_ptr<AnalogInput> input = devices_.createAnalog(name);
  if (!input) {
    Logger::warn("Input: no analog input for axis %s", name.c_str());
    return false;
  }
  axes_.push_back(Axis{name, std::move(input), 0.0f});
  return true;
}

void InputRouter::poll(TimeMs nowMs) {
  sampleAxes();

  std::vector<std::string> down;
  readDown(down);

  // Single-sample debounce: a changed read is only recorded here, and acted on
  // when the next poll reads the same thing.
  if (down != lastRead_) {
    lastRead_ = down;
    return;
  }

  std::vector<std::string> freshDown;
  std::vector<std::string> freshUp;
  for (const std::string &b : down) {
    if (!containsName(pressed_, b)) freshDown.push_back(b);
  }
  for (const std::string &b : pressed_) {
    if (!containsName(down, b)) freshUp.push_back(b);
  }

  if (freshDown.empty() && freshUp.empty()) return;

  for (const std::string &b : freshDown) pressed_.push_back(b);
  for (const std::string &b : freshUp) {
    pressed_.erase(std::find(pressed_.begin(), pressed_.end(), b));
  }

  dispatch(nowMs, freshDown, freshUp);
}

float InputRouter::axis(const std::string &name) const {
  for (const Axis &a : axes_) {
    if (a.name == name) return a.value;
  }
  return 0.0f;
}

bool InputRouter::isPressed(const std::string &name) const {
  return containsName(pressed_, name);
}

bool InputRouter::isKnownButton(const std::string &name) const {
  for (const PinButton &b : pinButtons_) {
    if (b.name == name) return true;
  }
  return containsName(unknownButtons_, name);
}

void InputRouter::setupButton(const std::string &name) {
  const ButtonKind kind = ButtonCatalog::classify(name);

  if (kind == ButtonKind::Gamepad) {
    // One shift register backs every gamepad button.
    if (gamepad_ || gamepadUnavailable_) return;
    gamepad_ = devices_.createGamepad();
    if (!gamepad_) {
      gamepadUnavailable_ = true;
      Logger::warn("Input: no gamepad on this board; %s will never fire", name.c_str());
    }
    return;
  }

  if (isKnownButton(name)) return;

  if (kind == ButtonKind::Unknown) {
    Logger::warn("Input: unknown button %s", name.c_str());
    unknownButtons_.push_back(name);
    return;
  }

  std::unique_ptr<DigitalInput> input =
      kind == ButtonKind::Touch ? devices_.createTouch(name) : devices_.createDigital(name);
  if (!input) {
    Logger::warn("Input: no %s input for %s", ButtonCatalog::kindName(kind), name.c_str());
  }
  pinButtons_.push_back(PinButton{name, kind, std::move(input)});
}

void InputRouter::sampleAxes() {
  for (Axis &a : axes_) {
    a.value = joystick_.normalize(a.input->read());
  }
}

void InputRouter::readDown(std::vector<std::string> &outDown) {
  for (PinButton &b : pinButtons_) {
    if (b.input && b.input->read()) outDown.push_back(b.name);
  }
  if (gamepad_) {
    const uint8_t bits = gamepad_->readBits();
    for (size_t i = 0; i < ButtonCatalog::kGamepadLayoutSize; ++i) {
      const GamepadButton &g = ButtonCatalog::kGamepadLayout[i];
      if (bits & g.mask) outDown.push_back(g.name);
    }
  }
}

void InputRouter::dispatch(TimeMs nowMs, const std::vector<std::string> &freshDown,
                           const std::vector<std::string> &freshUp) {
  // Handlers may bind or cancel. The pass covers the bindings present when it
  // started; cancels and replacements are applied by finishDispatch().
  dispatching_ = true;
  const size_t count = bindings_.size();
  for (size_t i = 0; i < count; ++i) {
    // Appends from a handler can reallocate, so nothing is held across the call.
    const Binding &b = bindings_[i];
    const std::vector<std::string> &edge = b.action == ButtonAction::Pressed ? freshDown : freshUp;
    if (!containsAll(edge, b.buttons)) continue;

    const ButtonCallback fn = b.fn;
    void* const ctx = b.ctx;
    if (fn(nowMs, ctx) != Propagation::Propagate) break;
  }
  finishDispatch();
}

void InputRouter::finishDispatch() {
  dispatching_ = false;
  bindings_.erase(std::remove_if(bindings_.begin(), bindings_.end(),
                                 [](const Binding &b) { return b.removed; }),
                  bindings_.end());

  for (const Binding &p : pendingReplacements_) {
    Binding* existing = findBinding(p.id);
    if (existing) {
      *existing = p;
    } else {
      bindings_.push_back(p);
    }
  }
  pendingReplacements_.clear();
}
