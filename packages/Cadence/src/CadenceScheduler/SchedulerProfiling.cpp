#include "CadenceScheduler/SchedulerProfiling.h"

#include <utility>

namespace cadence {

void SchedulerProfiler::startLoggingProfilingEvents() {
  logging_ = true;
  events_.clear();
}

void SchedulerProfiler::stopLoggingProfilingEvents() {
  logging_ = false;
}

bool SchedulerProfiler::isLogging() const {
  return logging_;
}

void SchedulerProfiler::markTaskStart(std::uint64_t taskId, SchedulerPriority priority, double time) {
  record(SchedulerProfilingEvent::TaskStart, taskId, priority, time);
}

void SchedulerProfiler::markTaskCompleted(std::uint64_t taskId, SchedulerPriority priority, double time) {
  record(SchedulerProfilingEvent::TaskComplete, taskId, priority, time);
}

void SchedulerProfiler::markTaskCanceled(std::uint64_t taskId, SchedulerPriority priority, double time) {
  record(SchedulerProfilingEvent::TaskCancel, taskId, priority, time);
}

void SchedulerProfiler::markTaskErrored(std::uint64_t taskId, SchedulerPriority priority, double time) {
  record(SchedulerProfilingEvent::TaskError, taskId, priority, time);
}

void SchedulerProfiler::markTaskRun(std::uint64_t taskId, SchedulerPriority priority, double time) {
  record(SchedulerProfilingEvent::TaskRun, taskId, priority, time);
}

void SchedulerProfiler::markTaskYield(std::uint64_t taskId, SchedulerPriority priority, double time) {
  record(SchedulerProfilingEvent::TaskYield, taskId, priority, time);
}

void SchedulerProfiler::markSchedulerSuspended(double time) {
  record(SchedulerProfilingEvent::SchedulerSuspend, 0, SchedulerPriority::NoPriority, time);
}

void SchedulerProfiler::markSchedulerUnsuspended(double time) {
  record(SchedulerProfilingEvent::SchedulerUnsuspend, 0, SchedulerPriority::NoPriority, time);
}

const std::vector<SchedulerProfilingRecord>& SchedulerProfiler::events() const {
  return events_;
}

std::vector<SchedulerProfilingRecord> SchedulerProfiler::takeEvents() {
  std::vector<SchedulerProfilingRecord> taken = std::move(events_);
  events_.clear();
  return taken;
}

void SchedulerProfiler::record(
    SchedulerProfilingEvent event,
    std::uint64_t taskId,
    SchedulerPriority priority,
    double time) {
  if (!logging_) {
    return;
  }
  events_.push_back(SchedulerProfilingRecord{event, taskId, priority, time});
}

} // namespace cadence
