// TaskRegistry.h
// Owns the periodic tasks and one-shot deadlines of the event loop, fires the
// ones that are due and computes the next wake time.
//
// A handler id lives in at most one of the two sets. Registering an id that
// is already present replaces its entry; it never duplicates it.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "src/domain/Types.h"

class TaskRegistry {
 public:
  // Insert or replace a periodic task. lastFired starts at 0, so the task is
  // due as soon as intervalMs has elapsed since time zero. intervalMs == 0
  // fires on every pass.
  void registerPeriodic(HandlerId id, uint32_t intervalMs, TaskCallback fn, void* ctx);

  // Insert or replace a one-shot task firing once at absolute time targetMs.
  void registerOneShotAt(HandlerId id, TimeMs targetMs, TaskCallback fn, void* ctx);

  // Remove id from whichever set holds it. Returns false if it was not registered.
  bool cancel(HandlerId id);

  // Earliest deadline over both sets. Returns false when nothing is registered.
  bool nextWake(TimeMs &outWakeMs) const;

  // Fire every task that is due at nowMs. The due set is fixed before the first
  // handler runs: tasks registered by a handler wait for the next pass, and tasks
  // cancelled by a handler still fire if they were already due.
  void firePass(TimeMs nowMs);

  bool contains(HandlerId id) const;
  bool isPeriodic(HandlerId id) const;
  size_t periodicCount() const { return periodic_.size(); }
  size_t oneShotCount() const { return oneShots_.size(); }
  bool empty() const { return periodic_.empty() && oneShots_.empty(); }

 private:
  struct PeriodicTask {
    HandlerId id;
    uint32_t intervalMs;
    TimeMs lastFiredMs;
    TaskCallback fn;
    void* ctx;
    uint32_t serial;  // changes on every (re-)registration
  };

  struct OneShotTask {
    HandlerId id;
    TimeMs targetMs;
    TaskCallback fn;
    void* ctx;
    uint32_t serial;
  };

  struct DueTask {
    HandlerId id;
    TaskCallback fn;
    void* ctx;
    uint32_t serial;
  };

  std::vector<PeriodicTask> periodic_;
  std::vector<OneShotTask> oneShots_;
  uint32_t nextSerial_ = 1;

  // Scratch lists reused across passes to avoid reallocating every tick.
  std::vector<DueTask> duePeriodic_;
  std::vector<DueTask> dueOneShots_;

  PeriodicTask* findPeriodic(HandlerId id);
  OneShotTask* findOneShot(HandlerId id);
  bool removePeriodic(HandlerId id);
  bool removeOneShot(HandlerId id);
};
