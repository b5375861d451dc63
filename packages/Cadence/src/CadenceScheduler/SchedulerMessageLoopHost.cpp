#include "CadenceScheduler/SchedulerMessageLoopHost.h"
#include "shared/CadenceGlobalError.h"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace cadence {

SchedulerMessageLoopHost::SchedulerMessageLoopHost()
  : baseTime_(std::chrono::steady_clock::now()) {
}

double SchedulerMessageLoopHost::getCurrentTime() const {
  const auto elapsed = std::chrono::steady_clock::now() - baseTime_;
  return std::chrono::duration<double, std::milli>(elapsed).count();
}

void SchedulerMessageLoopHost::requestHostCallback(HostCallback callback) {
  scheduledHostCallback_ = std::move(callback);
  if (!isMessageLoopRunning_) {
    isMessageLoopRunning_ = true;
    schedulePerformWorkUntilDeadline();
  }
}

void SchedulerMessageLoopHost::cancelHostCallback() {
  scheduledHostCallback_ = nullptr;
}

void SchedulerMessageLoopHost::requestHostTimeout(HostTimeoutCallback callback, double ms) {
  if (taskTimeoutId_ != 0) {
    clearTimeout(taskTimeoutId_);
  }
  taskTimeoutId_ = setTimeout([this, callback = std::move(callback)]() {
    taskTimeoutId_ = 0;
    callback(getCurrentTime());
  }, ms);
}

void SchedulerMessageLoopHost::cancelHostTimeout() {
  if (taskTimeoutId_ != 0) {
    clearTimeout(taskTimeoutId_);
    taskTimeoutId_ = 0;
  }
}

bool SchedulerMessageLoopHost::shouldYieldToHost() const {
  if (enableRequestPaint && needsPaint_) {
    return true;
  }
  return getCurrentTime() >= deadline_;
}

void SchedulerMessageLoopHost::requestPaint() {
  needsPaint_ = true;
}

void SchedulerMessageLoopHost::forceFrameRate(double fps) {
  double interval = yieldInterval_;
  if (computeYieldInterval(fps, interval)) {
    yieldInterval_ = interval;
  }
}

void SchedulerMessageLoopHost::postMessage(Message message) {
  messages_.push_back(std::move(message));
}

SchedulerMessageLoopHost::TimerId SchedulerMessageLoopHost::setTimeout(Message callback, double ms) {
  const TimerId id = nextTimerId_++;
  timers_.push_back(Timer{id, getCurrentTime() + std::max(ms, 0.0), std::move(callback)});
  return id;
}

void SchedulerMessageLoopHost::clearTimeout(TimerId id) {
  timers_.erase(
    std::remove_if(timers_.begin(), timers_.end(), [id](const Timer& timer) {
      return timer.id == id;
    }),
    timers_.end());
}

std::vector<SchedulerMessageLoopHost::Timer>::iterator SchedulerMessageLoopHost::findEarliestTimer() {
  return std::min_element(timers_.begin(), timers_.end(), [](const Timer& a, const Timer& b) {
    if (a.dueTime != b.dueTime) {
      return a.dueTime < b.dueTime;
    }
    return a.id < b.id;
  });
}

bool SchedulerMessageLoopHost::runOnce() {
  auto timer = findEarliestTimer();
  if (timer != timers_.end() && (timer->dueTime <= getCurrentTime() || messages_.empty())) {
    if (timer->dueTime > getCurrentTime()) {
      const auto wait = std::chrono::duration<double, std::milli>(timer->dueTime - getCurrentTime());
      std::this_thread::sleep_for(wait);
    }
    Message callback = std::move(timer->callback);
    timers_.erase(timer);
    callback();
    return true;
  }

  if (messages_.empty()) {
    return false;
  }

  Message message = std::move(messages_.front());
  messages_.pop_front();
  message();
  return true;
}

void SchedulerMessageLoopHost::run() {
  stopRequested_ = false;
  while (!stopRequested_) {
    try {
      if (!runOnce()) {
        return;
      }
    } catch (const std::exception& ex) {
      reportGlobalError(ex);
    }
  }
}

void SchedulerMessageLoopHost::stop() {
  stopRequested_ = true;
}

bool SchedulerMessageLoopHost::hasPendingWork() const {
  return !messages_.empty() || !timers_.empty();
}

double SchedulerMessageLoopHost::yieldInterval() const {
  return yieldInterval_;
}

void SchedulerMessageLoopHost::schedulePerformWorkUntilDeadline() {
  postMessage([this]() { performWorkUntilDeadline(); });
}

void SchedulerMessageLoopHost::performWorkUntilDeadline() {
  if (scheduledHostCallback_) {
    const double currentTime = getCurrentTime();
    // Yield after yieldInterval_ ms so there is always time remaining at the
    // start of a message.
    deadline_ = currentTime + yieldInterval_;
    const bool hasTimeRemaining = true;

    HostCallback callback = scheduledHostCallback_;
    bool hasMoreWork = false;
    try {
      hasMoreWork = callback(hasTimeRemaining, currentTime);
    } catch (...) {
      // Keep the pipeline alive, then let the error reach the loop.
      schedulePerformWorkUntilDeadline();
      needsPaint_ = false;
      throw;
    }

    if (!hasMoreWork) {
      isMessageLoopRunning_ = false;
      scheduledHostCallback_ = nullptr;
    } else {
      schedulePerformWorkUntilDeadline();
    }
  } else {
    isMessageLoopRunning_ = false;
  }
  // Yielding gives the host a chance to paint.
  needsPaint_ = false;
}

} // namespace cadence
