#include "CadenceScheduler/SchedulerMockHost.h"

#include <stdexcept>
#include <utility>

namespace cadence {

double SchedulerMockHost::getCurrentTime() const {
  return currentTime_;
}

void SchedulerMockHost::requestHostCallback(HostCallback callback) {
  scheduledCallback_ = std::move(callback);
}

void SchedulerMockHost::cancelHostCallback() {
  scheduledCallback_ = nullptr;
}

void SchedulerMockHost::requestHostTimeout(HostTimeoutCallback callback, double ms) {
  scheduledTimeout_ = std::move(callback);
  timeoutTime_ = currentTime_ + ms;
}

void SchedulerMockHost::cancelHostTimeout() {
  scheduledTimeout_ = nullptr;
  timeoutTime_ = -1.0;
}

bool SchedulerMockHost::shouldYieldToHost() const {
  if (shouldYieldNow_) {
    return true;
  }
  if (enableRequestPaint && needsPaint_) {
    return true;
  }
  return currentTime_ >= deadline_;
}

void SchedulerMockHost::requestPaint() {
  needsPaint_ = true;
}

void SchedulerMockHost::forceFrameRate(double fps) {
  double interval = yieldInterval_;
  if (computeYieldInterval(fps, interval)) {
    yieldInterval_ = interval;
  }
}

void SchedulerMockHost::advanceTime(double ms) {
  currentTime_ += ms;
  if (!isFlushing_) {
    fireTimeoutIfDue();
  }
}

bool SchedulerMockHost::flushSlice() {
  if (!scheduledCallback_) {
    return false;
  }

  ++sliceCount_;
  deadline_ = currentTime_ + yieldInterval_;
  isFlushing_ = true;

  HostCallback callback = scheduledCallback_;
  bool hasMoreWork = false;
  try {
    hasMoreWork = callback(true, currentTime_);
  } catch (...) {
    // scheduledCallback_ is left in place so the next slice retries.
    isFlushing_ = false;
    needsPaint_ = false;
    throw;
  }

  isFlushing_ = false;
  needsPaint_ = false;
  if (!hasMoreWork) {
    scheduledCallback_ = nullptr;
  }

  // Time advanced by tasks may have made the host timeout due.
  fireTimeoutIfDue();
  return hasMoreWork;
}

void SchedulerMockHost::flushAll() {
  std::size_t slices = 0;
  while (scheduledCallback_) {
    if (++slices > kMaxFlushSlices) {
      throw std::logic_error("SchedulerMockHost::flushAll did not drain the scheduler");
    }
    flushSlice();
  }
}

bool SchedulerMockHost::runTimeout() {
  if (!scheduledTimeout_) {
    return false;
  }
  HostTimeoutCallback timeout = std::move(scheduledTimeout_);
  scheduledTimeout_ = nullptr;
  timeoutTime_ = -1.0;
  timeout(currentTime_);
  return true;
}

void SchedulerMockHost::setShouldYieldNow(bool shouldYield) {
  shouldYieldNow_ = shouldYield;
}

bool SchedulerMockHost::hasPendingCallback() const {
  return static_cast<bool>(scheduledCallback_);
}

bool SchedulerMockHost::hasPendingTimeout() const {
  return static_cast<bool>(scheduledTimeout_);
}

double SchedulerMockHost::pendingTimeoutTime() const {
  return timeoutTime_;
}

bool SchedulerMockHost::needsPaint() const {
  return needsPaint_;
}

double SchedulerMockHost::yieldInterval() const {
  return yieldInterval_;
}

std::size_t SchedulerMockHost::sliceCount() const {
  return sliceCount_;
}

void SchedulerMockHost::fireTimeoutIfDue() {
  if (scheduledTimeout_ && timeoutTime_ <= currentTime_) {
    runTimeout();
  }
}

} // namespace cadence
