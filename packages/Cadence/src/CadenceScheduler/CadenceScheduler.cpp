#include "CadenceScheduler/CadenceScheduler.h"

#include <stdexcept>
#include <utility>

namespace cadence {

CadenceScheduler::CadenceScheduler(std::shared_ptr<SchedulerHostConfig> host)
  : host_(std::move(host)) {
  if (!host_) {
    throw std::invalid_argument("CadenceScheduler requires a host config");
  }
}

CadenceScheduler::~CadenceScheduler() {
  // The host holds callbacks bound to this instance.
  host_->cancelHostCallback();
  host_->cancelHostTimeout();
}

TaskHandle CadenceScheduler::scheduleCallback(
    SchedulerPriority priority,
    SchedulerCallback callback,
    const TaskOptions& options) {
  priority = normalizePriority(priority);
  const double currentTime = now();

  double startTime = currentTime;
  if (options.delayMs > 0.0) {
    startTime = currentTime + options.delayMs;
  }

  const double expirationTime = startTime + priorityToTimeout(priority);

  SchedulerTask* newTask = createTask(priority, std::move(callback), startTime, expirationTime);

  if (startTime > currentTime) {
    // This is a delayed task.
    newTask->sortIndex = startTime;
    timerQueue_.push(newTask);

    if (taskQueue_.empty() && newTask == timerQueue_.peek()) {
      // All tasks are delayed, and this is the task with the earliest delay.
      if (isHostTimeoutScheduled_) {
        cancelHostTimeout();
      }
      requestHostTimeout(startTime - currentTime);
    }
  } else {
    newTask->sortIndex = expirationTime;
    taskQueue_.push(newTask);
    newTask->isQueued = true;
    if (profiler_) {
      profiler_->markTaskStart(newTask->id, newTask->priorityLevel, currentTime);
    }

    // If we're already performing work, wait until the next time we yield.
    if (!isHostCallbackScheduled_ && !isPerformingWork_) {
      requestHostCallback();
    }
  }

  return TaskHandle{newTask->id};
}

TaskHandle CadenceScheduler::scheduleTask(
    SchedulerPriority priority,
    Task task,
    const TaskOptions& options) {
  return scheduleCallback(priority, [task = std::move(task)](bool /*didTimeout*/) {
    task();
    return SchedulerCallbackResult::done();
  }, options);
}

void CadenceScheduler::cancelCallback(TaskHandle handle) {
  SchedulerTask* task = findTask(handle);
  if (task == nullptr) {
    return;
  }

  if (profiler_ && task->isQueued) {
    profiler_->markTaskCanceled(task->id, task->priorityLevel, now());
  }
  task->isQueued = false;
  task->isCancelled = true;

  // Null out the callback to indicate the task has been canceled. Arbitrary
  // nodes can't be removed from an array based heap, only the first one.
  task->callback = nullptr;
}

SchedulerPriority CadenceScheduler::getCurrentPriorityLevel() const {
  return currentPriorityLevel_;
}

TaskHandle CadenceScheduler::getFirstCallbackNode() const {
  const SchedulerTask* first = taskQueue_.peek();
  return first != nullptr ? TaskHandle{first->id} : TaskHandle{};
}

bool CadenceScheduler::shouldYield() const {
  return host_->shouldYieldToHost();
}

double CadenceScheduler::now() const {
  return host_->getCurrentTime();
}

void CadenceScheduler::requestPaint() {
  host_->requestPaint();
}

void CadenceScheduler::forceFrameRate(double fps) {
  host_->forceFrameRate(fps);
}

void CadenceScheduler::pauseExecution() {
  isSchedulerPaused_ = true;
}

void CadenceScheduler::continueExecution() {
  isSchedulerPaused_ = false;
  if (!isHostCallbackScheduled_ && !isPerformingWork_) {
    requestHostCallback();
  }
}

bool CadenceScheduler::flushWork(bool hasTimeRemaining, double initialTime) {
  if (isPerformingWork_) {
    throw std::logic_error("Cannot flush scheduler work while already performing work");
  }

  if (profiler_) {
    profiler_->markSchedulerUnsuspended(initialTime);
  }

  // We'll need a host callback the next time work is scheduled.
  isHostCallbackScheduled_ = false;

  if (isHostTimeoutScheduled_) {
    // We scheduled a timeout but it's no longer needed. Cancel it.
    isHostTimeoutScheduled_ = false;
    host_->cancelHostTimeout();
  }

  isPerformingWork_ = true;
  const SchedulerPriority previousPriorityLevel = currentPriorityLevel_;

  bool hasMoreWork = false;

  try {
    hasMoreWork = workLoop(hasTimeRemaining, initialTime);
  } catch (...) {
    if (currentTask_ != nullptr) {
      if (profiler_) {
        profiler_->markTaskErrored(currentTask_->id, currentTask_->priorityLevel, now());
      }
      currentTask_->isQueued = false;
    }
    finishFlush(previousPriorityLevel);
    throw;
  }

  finishFlush(previousPriorityLevel);
  return hasMoreWork;
}

void CadenceScheduler::finishFlush(SchedulerPriority previousPriorityLevel) {
  currentTask_ = nullptr;
  currentPriorityLevel_ = previousPriorityLevel;
  isPerformingWork_ = false;
  if (profiler_) {
    profiler_->markSchedulerSuspended(now());
  }
}

void CadenceScheduler::advanceTimers(double currentTime) {
  // Check for tasks that are no longer delayed and add them to the queue.
  SchedulerTask* timer = timerQueue_.peek();
  while (timer != nullptr) {
    if (!timer->callback) {
      // Timer was cancelled.
      timerQueue_.pop();
      releaseTask(timer);
    } else if (timer->startTime <= currentTime) {
      // Timer fired. Transfer to the task queue.
      timerQueue_.pop();
      timer->sortIndex = timer->expirationTime;
      taskQueue_.push(timer);
      timer->isQueued = true;
      if (profiler_) {
        profiler_->markTaskStart(timer->id, timer->priorityLevel, currentTime);
      }
    } else {
      // Remaining timers are pending.
      return;
    }
    timer = timerQueue_.peek();
  }
}

void CadenceScheduler::handleTimeout(double currentTime) {
  isHostTimeoutScheduled_ = false;
  advanceTimers(currentTime);

  if (!isHostCallbackScheduled_) {
    if (taskQueue_.peek() != nullptr) {
      requestHostCallback();
    } else {
      const SchedulerTask* firstTimer = timerQueue_.peek();
      if (firstTimer != nullptr) {
        requestHostTimeout(firstTimer->startTime - currentTime);
      }
    }
  }
}

bool CadenceScheduler::workLoop(bool hasTimeRemaining, double initialTime) {
  double currentTime = initialTime;
  advanceTimers(currentTime);
  currentTask_ = taskQueue_.peek();

  while (currentTask_ != nullptr && !(enableSchedulerDebugging && isSchedulerPaused_)) {
    if (currentTask_->expirationTime > currentTime && (!hasTimeRemaining || shouldYield())) {
      // This task hasn't expired, and we've reached the deadline.
      break;
    }

    if (currentTask_->callback) {
      SchedulerCallback callback = std::move(currentTask_->callback);
      currentTask_->callback = nullptr;
      currentPriorityLevel_ = currentTask_->priorityLevel;
      const bool didUserCallbackTimeout = currentTask_->expirationTime <= currentTime;
      if (profiler_) {
        profiler_->markTaskRun(currentTask_->id, currentTask_->priorityLevel, currentTime);
      }

      SchedulerCallbackResult result = callback(didUserCallbackTimeout);
      currentTime = now();

      if (result.hasContinuation && result.continuation && !currentTask_->isCancelled) {
        currentTask_->callback = std::move(result.continuation);
        if (profiler_) {
          profiler_->markTaskYield(currentTask_->id, currentTask_->priorityLevel, currentTime);
        }
      } else {
        if (profiler_ && !currentTask_->isCancelled) {
          profiler_->markTaskCompleted(currentTask_->id, currentTask_->priorityLevel, currentTime);
        }
        currentTask_->isQueued = false;
        // The task may have scheduled more urgent work ahead of itself; in
        // that case it is discarded later like a cancelled task.
        if (currentTask_ == taskQueue_.peek()) {
          taskQueue_.pop();
          releaseTask(currentTask_);
        }
      }
      advanceTimers(currentTime);
    } else {
      SchedulerTask* cancelled = taskQueue_.pop();
      releaseTask(cancelled);
    }

    currentTask_ = taskQueue_.peek();
  }

  // Return whether there's additional work
  if (currentTask_ != nullptr) {
    return true;
  }

  const SchedulerTask* firstTimer = timerQueue_.peek();
  if (firstTimer != nullptr) {
    requestHostTimeout(firstTimer->startTime - currentTime);
  }
  return false;
}

SchedulerTask* CadenceScheduler::createTask(
    SchedulerPriority priority,
    SchedulerCallback callback,
    double startTime,
    double expirationTime) {

  const uint64_t taskId = nextTaskId_++;
  auto taskPtr = std::make_unique<SchedulerTask>(
    taskId, std::move(callback), priority, startTime, expirationTime);

  SchedulerTask* rawPtr = taskPtr.get();
  taskStorage_.emplace(taskId, std::move(taskPtr));
  return rawPtr;
}

void CadenceScheduler::requestHostCallback() {
  isHostCallbackScheduled_ = true;
  host_->requestHostCallback([this](bool hasTimeRemaining, double initialTime) {
    return flushWork(hasTimeRemaining, initialTime);
  });
}

void CadenceScheduler::requestHostTimeout(double ms) {
  isHostTimeoutScheduled_ = true;
  host_->requestHostTimeout([this](double currentTime) {
    handleTimeout(currentTime);
  }, ms);
}

void CadenceScheduler::cancelHostTimeout() {
  isHostTimeoutScheduled_ = false;
  host_->cancelHostTimeout();
}

void CadenceScheduler::releaseTask(SchedulerTask* task) {
  if (task == nullptr) {
    return;
  }
  taskStorage_.erase(task->id);
}

SchedulerTask* CadenceScheduler::findTask(TaskHandle handle) const {
  if (!handle) {
    return nullptr;
  }
  auto it = taskStorage_.find(handle.id);
  return it != taskStorage_.end() ? it->second.get() : nullptr;
}

std::size_t CadenceScheduler::readyTaskCount() const {
  return taskQueue_.size();
}

std::size_t CadenceScheduler::delayedTaskCount() const {
  return timerQueue_.size();
}

bool CadenceScheduler::isTaskPending(TaskHandle handle) const {
  const SchedulerTask* task = findTask(handle);
  return task != nullptr && static_cast<bool>(task->callback);
}

bool CadenceScheduler::isPaused() const {
  return isSchedulerPaused_;
}

void CadenceScheduler::setProfiler(std::shared_ptr<SchedulerProfiler> profiler) {
  profiler_ = std::move(profiler);
}

} // namespace cadence
