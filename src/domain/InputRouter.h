// InputRouter.h
// Owns the logical buttons, joystick axes and combo bindings. Each poll reads
// the raw inputs, confirms changes with a single-sample debounce, derives the
// fresh press/release sets and dispatches matching bindings in registration
// order until one consumes the event.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "src/domain/ButtonCatalog.h"
#include "src/domain/InputDevices.h"
#include "src/domain/Joystick.h"
#include "src/domain/Types.h"

class InputRouter {
 public:
  explicit InputRouter(InputDeviceFactory &devices, const JoystickConfig &joystick = JoystickConfig());

  // Register a combo binding. Drivers for buttons not seen before are created
  // here. Returns false, registering nothing, when buttons is empty or names a
  // button twice. Unknown identifiers are logged and never read as down, but
  // the binding is still registered.
  // A binding already registered under id is replaced in place and keeps its
  // dispatch position. Replacements made from a handler take effect once the
  // current dispatch pass is over.
  bool bind(HandlerId id, const std::vector<std::string> &buttons, ButtonAction action,
            ButtonCallback fn, void* ctx);

  // Remove the binding registered under id. Returns false if none. A binding
  // cancelled from a handler still gets its turn in the current pass.
  bool cancel(HandlerId id);

  // Create the analog driver for a JOYSTICK_* axis. Idempotent.
  bool attachAxis(const std::string &name);

  // Read all inputs once and dispatch. Called from the event loop's poll task.
  void poll(TimeMs nowMs);

  // Latest normalized value of an attached axis, 0.0 for unknown axes.
  float axis(const std::string &name) const;

  // Whether name is in the confirmed pressed set.
  bool isPressed(const std::string &name) const;
  const std::vector<std::string> &pressed() const { return pressed_; }

  size_t bindingCount() const;

  // True once there is anything worth polling: a binding or an axis.
  bool hasPollSources() const { return bindingCount() > 0 || !axes_.empty(); }

 private:
  struct Binding {
    HandlerId id;
    std::vector<std::string> buttons;
    ButtonAction action;
    ButtonCallback fn;
    void* ctx;
    bool removed;  // cancelled during dispatch, erased when the pass ends
  };

  // A discrete or touch button with its driver. Buttons that could not be
  // backed keep a null driver so they are only reported once.
  struct PinButton {
    std::string name;
    ButtonKind kind;
    std::unique_ptr<DigitalInput> input;
  };

  struct Axis {
    std::string name;
    std::unique_ptr<AnalogInput> input;
    float value;
  };

  InputDeviceFactory &devices_;
  Joystick joystick_;

  std::vector<Binding> bindings_;
  std::vector<Binding> pendingReplacements_;  // binds made during dispatch
  bool dispatching_ = false;
  std::vector<PinButton> pinButtons_;
  std::vector<std::string> unknownButtons_;  // already reported, never polled
  std::unique_ptr<ShiftRegisterInput> gamepad_;
  bool gamepadUnavailable_ = false;
  std::vector<Axis> axes_;

  std::vector<std::string> lastRead_;  // last raw sample, for the debounce
  std::vector<std::string> pressed_;   // confirmed down set

  Binding* findBinding(HandlerId id);
  bool isKnownButton(const std::string &name) const;
  void setupButton(const std::string &name);
  void sampleAxes();
  void readDown(std::vector<std::string> &outDown);
  void dispatch(TimeMs nowMs, const std::vector<std::string> &freshDown,
                const std::vector<std::string> &freshUp);
  void finishDispatch();
};
