// Types.h
// Shared vocabulary of the scheduler and input core: time, handler identity
// and the C-style callback shapes handlers are registered with.

#pragma once

#include <stdint.h>

// Milliseconds from the monotonic clock. 64-bit so it never wraps in practice.
using TimeMs = uint64_t;

// Opaque identity of a registered task or button binding.
using HandlerId = uint32_t;
static constexpr HandlerId kNoHandler = 0;

// Result of a button handler: keep evaluating later bindings, or stop here.
enum class Propagation {
  Consumed,
  Propagate,
};

// Which edge of a combo a binding reacts to.
enum class ButtonAction {
  Pressed,   // every button of the combo went down on the same poll
  Released,  // every button of the combo went up on the same poll
};

// C-style callbacks to avoid libstdc++ bloat from std::function.
using TaskCallback = void (*)(TimeMs nowMs, void* ctx);
using ButtonCallback = Propagation (*)(TimeMs nowMs, void* ctx);
