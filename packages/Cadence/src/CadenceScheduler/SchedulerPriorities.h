#pragma once

#include "CadenceScheduler/Scheduler.h"
#include "CadenceScheduler/SchedulerFeatureFlags.h"

namespace cadence {

inline constexpr SchedulerPriority NoPriority = SchedulerPriority::NoPriority;
inline constexpr SchedulerPriority ImmediatePriority = SchedulerPriority::ImmediatePriority;
inline constexpr SchedulerPriority UserBlockingPriority = SchedulerPriority::UserBlockingPriority;
inline constexpr SchedulerPriority NormalPriority = SchedulerPriority::NormalPriority;
inline constexpr SchedulerPriority LowPriority = SchedulerPriority::LowPriority;
inline constexpr SchedulerPriority IdlePriority = SchedulerPriority::IdlePriority;

// NoPriority and out-of-range ordinals are not runnable levels.
constexpr bool isValidPriority(SchedulerPriority priority) {
  return priority >= ImmediatePriority && priority <= IdlePriority;
}

// Unknown levels run as Normal.
constexpr SchedulerPriority normalizePriority(SchedulerPriority priority) {
  return isValidPriority(priority) ? priority : NormalPriority;
}

// Added to a task's start time to get its expiration time.
constexpr double priorityToTimeout(SchedulerPriority priority) {
  switch (normalizePriority(priority)) {
    case ImmediatePriority:
      return immediatePriorityTimeout;
    case UserBlockingPriority:
      return userBlockingPriorityTimeout;
    case LowPriority:
      return lowPriorityTimeout;
    case IdlePriority:
      return idlePriorityTimeout;
    default:
      return normalPriorityTimeout;
  }
}

} // namespace cadence
