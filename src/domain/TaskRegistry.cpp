// TaskRegistry.cpp

#include "TaskRegistry.h"

void TaskRegistry::registerPeriodic(HandlerId id, uint32_t intervalMs, TaskCallback fn, void* ctx) {
  const uint32_t serial = nextSerial_++;
  removeOneShot(id);
  PeriodicTask* existing = findPeriodic(id);
  if (existing) {
    // Replace in place so the task keeps its position in the firing order.
    existing->intervalMs = intervalMs;
    existing->lastFiredMs = 0;
    existing->fn = fn;
    existing->ctx = ctx;
    existing->serial = serial;
    return;
  }
  periodic_.push_back(PeriodicTask{id, intervalMs, 0, fn, ctx, serial});
}

void TaskRegistry::registerOneShotAt(HandlerId id, TimeMs targetMs, TaskCallback fn, void* ctx) {
  const uint32_t serial = nextSerial_++;
  removePeriodic(id);
  OneShotTask* existing = findOneShot(id);
  if (existing) {
    existing->targetMs = targetMs;
    existing->fn = fn;
    existing->ctx = ctx;
    existing->serial = serial;
    return;
  }
  oneShots_.push_back(OneShotTask{id, targetMs, fn, ctx, serial});
}

bool TaskRegistry::cancel(HandlerId id) {
  // Invariant: at most one of these succeeds.
  const bool removedPeriodic = removePeriodic(id);
  const bool removedOneShot = removeOneShot(id);
  return removedPeriodic || removedOneShot;
}

bool TaskRegistry::nextWake(TimeMs &outWakeMs) const {
  bool found = false;
  TimeMs earliest = 0;
  for (const PeriodicTask &t : periodic_) {
    const TimeMs due = t.lastFiredMs + t.intervalMs;
    if (!found || due < earliest) {
      earliest = due;
      found = true;
    }
  }
  for (const OneShotTask &t : oneShots_) {
    if (!found || t.targetMs < earliest) {
      earliest = t.targetMs;
      found = true;
    }
  }
  if (found) outWakeMs = earliest;
  return found;
}

void TaskRegistry::firePass(TimeMs nowMs) {
  duePeriodic_.clear();
  dueOneShots_.clear();
  for (const PeriodicTask &t : periodic_) {
    if (t.lastFiredMs + t.intervalMs <= nowMs) {
      duePeriodic_.push_back(DueTask{t.id, t.fn, t.ctx, t.serial});
    }
  }
  for (const OneShotTask &t : oneShots_) {
    if (t.targetMs <= nowMs) {
      dueOneShots_.push_back(DueTask{t.id, t.fn, t.ctx, t.serial});
    }
  }

  for (size_t i = 0; i < duePeriodic_.size(); ++i) {
    const DueTask due = duePeriodic_[i];
    if (due.fn) due.fn(nowMs, due.ctx);
    // Re-anchor to the actual fire time. Missed ticks are dropped, not replayed.
    // A handler that re-registered or cancelled this id keeps its new state.
    PeriodicTask* t = findPeriodic(due.id);
    if (t && t->serial == due.serial) t->lastFiredMs = nowMs;
  }

  for (size_t i = 0; i < dueOneShots_.size(); ++i) {
    const DueTask due = dueOneShots_[i];
    // Remove before invoking so the handler can schedule itself again under
    // the same id without being treated as already fired.
    OneShotTask* t = findOneShot(due.id);
    if (t && t->serial == due.serial) removeOneShot(due.id);
    if (due.fn) due.fn(nowMs, due.ctx);
  }
}

bool TaskRegistry::contains(HandlerId id) const {
  for (const PeriodicTask &t : periodic_) {
    if (t.id == id) return true;
  }
  for (const OneShotTask &t : oneShots_) {
    if (t.id == id) return true;
  }
  return false;
}

bool TaskRegistry::isPeriodic(HandlerId id) const {
  for (const PeriodicTask &t : periodic_) {
    if (t.id == id) return true;
  }
  return false;
}

TaskRegistry::PeriodicTask* TaskRegistry::findPeriodic(HandlerId id) {
  for (PeriodicTask &t : periodic_) {
    if (t.id == id) return &t;
  }
  return nullptr;
}

TaskRegistry::OneShotTask* TaskRegistry::findOneShot(HandlerId id) {
  for (OneShotTask &t : oneShots_) {
    if (t.id == id) return &t;
  }
  return nullptr;
}

bool TaskRegistry::removePeriodic(HandlerId id) {
  for (auto it = periodic_.begin(); it != periodic_.end(); ++it) {
    if (it->id == id) {
      periodic_.erase(it);
      return true;
    }
  }
  return false;
}

bool TaskRegistry::removeOneShot(HandlerId id) {
  for (auto it = oneShots_.begin(); it != oneShots_.end(); ++it) {
    if (it->id == id) {
      oneShots_.erase(it);
      return true;
    }
  }
  return false;
}
