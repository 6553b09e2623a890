// EventLoop.h
// Cooperative single-threaded runtime. Owns the task registry and the input
// router, exposes the registration API used by games, and drives everything
// from one loop that fires due tasks and then sleeps until the next deadline.
//
// Handler ids are shared by tasks and bindings. Every registration call
// returns the id in effect: pass kNoHandler to allocate a new one, or an id
// returned earlier to replace that registration, whether it was a task or a
// binding. Ids chosen by the caller are never handed out by the allocator.

#pragma once

#include <stdint.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "src/config/BuildConfig.h"
#include "src/domain/AudioOutput.h"
#include "src/domain/Clock.h"
#include "src/domain/InputDevices.h"
#include "src/domain/InputRouter.h"
#include "src/domain/TaskRegistry.h"
#include "src/domain/Types.h"

class EventLoop {
 public:
  enum class State {
    Idle,
    Running,
    Stopped,  // terminal
  };

  EventLoop(Clock &clock, InputDeviceFactory &devices,
            uint32_t pollIntervalMs = BUILD_INPUT_POLL_INTERVAL_MS,
            const JoystickConfig &joystick = JoystickConfig());

  // Run fn on every pass of the loop.
  HandlerId onTick(TaskCallback fn, void* ctx = nullptr, HandlerId id = kNoHandler);

  // Run fn every intervalMs. First run happens once intervalMs has elapsed since time zero.
  HandlerId onInterval(uint32_t intervalMs, TaskCallback fn, void* ctx = nullptr,
                       HandlerId id = kNoHandler);

  // Run fn once at absolute time timeMs.
  HandlerId at(TimeMs timeMs, TaskCallback fn, void* ctx = nullptr, HandlerId id = kNoHandler);

  // Run fn once, delayMs from now.
  HandlerId after(uint32_t delayMs, TaskCallback fn, void* ctx = nullptr, HandlerId id = kNoHandler);

  // Remove a task or binding. Unknown ids are ignored.
  void cancel(HandlerId id);
  void cancel(std::initializer_list<HandlerId> ids);

  // Bind a button combo. Returns kNoHandler if the combo is rejected.
  HandlerId bind(const std::vector<std::string> &buttons, ButtonCallback fn, void* ctx = nullptr,
                 ButtonAction action = ButtonAction::Pressed, HandlerId id = kNoHandler);

  // Create the driver for a JOYSTICK_* axis so it is sampled on every poll.
  bool attachAxis(const std::string &name);

  // Run the loop until halt() is called or nothing is left to schedule.
  // initial, when given, runs first as a one-shot at time zero.
  void run(TaskCallback initial = nullptr, void* ctx = nullptr);

  // Stop the loop at the end of the current pass. Safe to call from any handler.
  void halt() { haltRequested_ = true; }

  // Speaker support. All of these are no-ops without an attached speaker.
  void attachSpeaker(AudioOutput* speaker) { speaker_ = speaker; }
  void enableSpeaker(bool on);
  // Plays a tone and schedules it to stop durationMs later. A new sound
  // replaces the pending stop of the previous one.
  void playSound(uint16_t frequencyHz, uint32_t durationMs);
  void stopSound();

  TimeMs nowMs() { return clock_.nowMs(); }
  float axis(const std::string &name) const { return input_.axis(name); }
  bool isPressed(const std::string &name) const { return input_.isPressed(name); }

  State state() const { return state_; }
  bool isRunning() const { return state_ == State::Running; }
  bool isStopped() const { return state_ == State::Stopped; }

  TaskRegistry &tasks() { return tasks_; }
  InputRouter &input() { return input_; }

 private:
  Clock &clock_;
  TaskRegistry tasks_;
  InputRouter input_;
  AudioOutput* speaker_ = nullptr;

  uint32_t pollIntervalMs_;
  HandlerId pollId_ = kNoHandler;
  HandlerId stopSoundId_ = kNoHandler;
  HandlerId nextId_ = 1;

  State state_ = State::Idle;
  bool haltRequested_ = false;

  HandlerId resolveId(HandlerId id);
  void reserveId(HandlerId id);
  // Registers the input poll task if the loop is running, there is input to
  // poll and the task is not already scheduled.
  void ensurePolling();
  void sleepUntil(TimeMs targetMs);

  static void pollThunk(TimeMs nowMs, void* ctx);
  static void stopSoundThunk(TimeMs nowMs, void* ctx);
};
