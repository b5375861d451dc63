#pragma once

#include "CadenceScheduler/CadenceScheduler.h"

#include "jsi/jsi.h"

#include <memory>

namespace cadence {

namespace jsi = facebook::jsi;

inline constexpr const char* kSchedulerBindingGlobalName = "nativeScheduler";

/**
 * Installs the global nativeScheduler object on runtime.
 *
 * The object exposes the unstable_* scheduling functions plus the priority
 * constants. A JS callback that returns a function continues its task with
 * that function. The scheduler must only be driven from the thread that owns
 * runtime, and runtime must outlive every task scheduled through it.
 */
void installSchedulerBinding(jsi::Runtime& runtime, std::shared_ptr<CadenceScheduler> scheduler);

} // namespace cadence
