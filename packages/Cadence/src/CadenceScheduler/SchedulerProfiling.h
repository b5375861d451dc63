#pragma once

#include "CadenceScheduler/Scheduler.h"

#include <cstdint>
#include <vector>

namespace cadence {

enum class SchedulerProfilingEvent : std::uint8_t {
  TaskStart = 1,
  TaskComplete = 2,
  TaskError = 3,
  TaskCancel = 4,
  TaskRun = 5,
  TaskYield = 6,
  SchedulerSuspend = 7,
  SchedulerUnsuspend = 8,
};

struct SchedulerProfilingRecord {
  SchedulerProfilingEvent event;
  std::uint64_t taskId{0};
  SchedulerPriority priority{SchedulerPriority::NoPriority};
  double time{0.0};
};

/**
 * Records task lifecycle events while logging is enabled.
 * Scheduler-level events (suspend/unsuspend) carry taskId 0.
 */
class SchedulerProfiler {
public:
  void startLoggingProfilingEvents();
  void stopLoggingProfilingEvents();
  [[nodiscard]] bool isLogging() const;

  void markTaskStart(std::uint64_t taskId, SchedulerPriority priority, double time);
  void markTaskCompleted(std::uint64_t taskId, SchedulerPriority priority, double time);
  void markTaskCanceled(std::uint64_t taskId, SchedulerPriority priority, double time);
  void markTaskErrored(std::uint64_t taskId, SchedulerPriority priority, double time);
  void markTaskRun(std::uint64_t taskId, SchedulerPriority priority, double time);
  void markTaskYield(std::uint64_t taskId, SchedulerPriority priority, double time);
  void markSchedulerSuspended(double time);
  void markSchedulerUnsuspended(double time);

  [[nodiscard]] const std::vector<SchedulerProfilingRecord>& events() const;
  std::vector<SchedulerProfilingRecord> takeEvents();

private:
  void record(SchedulerProfilingEvent event, std::uint64_t taskId, SchedulerPriority priority, double time);

  bool logging_{false};
  std::vector<SchedulerProfilingRecord> events_{};
};

} // namespace cadence
