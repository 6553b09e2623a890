// EventLoop.cpp

#include "EventLoop.h"

#include "src/infrastructure/Logger.h"

EventLoop::EventLoop(Clock &clock, InputDeviceFactory &devices, uint32_t pollIntervalMs,
                     const JoystickConfig &joystick)
    : clock_(clock), input_(devices, joystick), pollIntervalMs_(pollIntervalMs) {}

HandlerId EventLoop::resolveId(HandlerId id) {
  if (id == kNoHandler) return nextId_++;
  reserveId(id);
  return id;
}

void EventLoop::reserveId(HandlerId id) {
  // Keep the allocator ahead of ids chosen by callers.
  if (id >= nextId_) nextId_ = id + 1;
}

void EventLoop::ensurePolling() {
  if (state_ != State::Running || !input_.hasPollSources()) return;
  if (pollId_ != kNoHandler && tasks_.contains(pollId_)) return;
  pollId_ = onInterval(pollIntervalMs_, &EventLoop::pollThunk, this, pollId_);
}

HandlerId EventLoop::onTick(TaskCallback fn, void* ctx, HandlerId id) {
  return onInterval(0, fn, ctx, id);
}

HandlerId EventLoop::onInterval(uint32_t intervalMs, TaskCallback fn, void* ctx, HandlerId id) {
  if (id != kNoHandler) input_.cancel(id);
  id = resolveId(id);
  tasks_.registerPeriodic(id, intervalMs, fn, ctx);
  return id;
}

HandlerId EventLoop::at(TimeMs timeMs, TaskCallback fn, void* ctx, HandlerId id) {
  if (id != kNoHandler) input_.cancel(id);
  id = resolveId(id);
  tasks_.registerOneShotAt(id, timeMs, fn, ctx);
  return id;
}

HandlerId EventLoop::after(uint32_t delayMs, TaskCallback fn, void* ctx, HandlerId id) {
  return at(clock_.nowMs() + delayMs, fn, ctx, id);
}

void EventLoop::cancel(HandlerId id) {
  if (id == kNoHandler) return;
  tasks_.cancel(id);
  input_.cancel(id);
}

void EventLoop::cancel(std::initializer_list<HandlerId> ids) {
  for (HandlerId id : ids) cancel(id);
}

HandlerId EventLoop::bind(const std::vector<std::string> &buttons, ButtonCallback fn, void* ctx,
                          ButtonAction action, HandlerId id) {
  // Validate before allocating so a rejected combo does not burn an id.
  const HandlerId resolved = id != kNoHandler ? id : nextId_;
  if (!input_.bind(resolved, buttons, action, fn, ctx)) return kNoHandler;
  if (id == kNoHandler) {
    ++nextId_;
  } else {
    reserveId(id);
    tasks_.cancel(id);
  }
  ensurePolling();
  return resolved;
}

bool EventLoop::attachAxis(const std::string &name) {
  if (!input_.attachAxis(name)) return false;
  ensurePolling();
  return true;
}

void EventLoop::run(TaskCallback initial, void* ctx) {
  if (state_ == State::Stopped) {
    Logger::warn("EventLoop: run() called after the loop stopped; ignoring");
    return;
  }
  if (state_ == State::Running) return;

  if (initial) at(0, initial, ctx);

  // Polling starts once there is input to poll, here or on the first bind or
  // attachAxis made while running; otherwise it would keep an empty loop alive.
  state_ = State::Running;
  ensurePolling();
  Logger::info("EventLoop: running (%u periodic, %u one-shot)", (unsigned)tasks_.periodicCount(),
               (unsigned)tasks_.oneShotCount());

  while (state_ == State::Running) {
    if (haltRequested_) break;

    const TimeMs now = clock_.nowMs();
    tasks_.firePass(now);
    if (haltRequested_) break;

    TimeMs wakeMs = 0;
    if (!tasks_.nextWake(wakeMs)) {
      Logger::info("EventLoop: nothing left to schedule");
      break;
    }
    sleepUntil(wakeMs);
  }

  state_ = State::Stopped;
  Logger::info("EventLoop: stopped");
}

void EventLoop::sleepUntil(TimeMs targetMs) {
  // sleepMs may undershoot; keep sleeping off the residual.
  for (;;) {
    const TimeMs now = clock_.nowMs();
    if (now >= targetMs) return;
    clock_.sleepMs(targetMs - now);
  }
}

void EventLoop::enableSpeaker(bool on) {
  if (!speaker_) {
    Logger::debug("EventLoop: no speaker attached");
    return;
  }
  speaker_->setEnabled(on);
  Logger::info("Speaker %s", on ? "on" : "off");
}

void EventLoop::playSound(uint16_t frequencyHz, uint32_t durationMs) {
  if (!speaker_) {
    Logger::debug("EventLoop: no speaker attached");
    return;
  }
  speaker_->play(frequencyHz);
  stopSoundId_ = after(durationMs, &EventLoop::stopSoundThunk, this, stopSoundId_);
}

void EventLoop::stopSound() {
  if (!speaker_) return;
  speaker_->stop();
}

void EventLoop::pollThunk(TimeMs nowMs, void* ctx) {
  EventLoop* self = static_cast<EventLoop*>(ctx);
  self->input_.poll(nowMs);
}

void EventLoop::stopSoundThunk(TimeMs, void* ctx) {
  static_cast<EventLoop*>(ctx)->stopSound();
}
