#pragma once

#include "CadenceScheduler/Scheduler.h"
#include "CadenceScheduler/SchedulerHostConfig.h"
#include "CadenceScheduler/SchedulerMinHeap.h"
#include "CadenceScheduler/SchedulerPriorities.h"
#include "CadenceScheduler/SchedulerProfiling.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>

namespace cadence {

/**
 * Internal task representation for the scheduler
 * sortIndex is startTime while delayed and expirationTime while ready.
 * An empty callback marks the task as cancelled or currently running.
 */
struct SchedulerTask : public HeapNode {
  SchedulerCallback callback;
  SchedulerPriority priorityLevel;
  double startTime;
  double expirationTime;
  bool isQueued{false};
  // Set by cancelCallback; a continuation returned afterwards is dropped.
  bool isCancelled{false};

  SchedulerTask(uint64_t taskId, SchedulerCallback cb, SchedulerPriority priority, double start, double expiration)
    : callback(std::move(cb)), priorityLevel(priority), startTime(start), expirationTime(expiration) {
    id = taskId;
    sortIndex = -1.0;
  }
};

/**
 * Cooperative priority scheduler
 *
 * - Ready queue ordered by expiration time, delayed queue ordered by start time
 * - Time-slicing through an injected SchedulerHostConfig
 * - Tasks continue across slices by returning a continuation
 * - Cancellation is lazy: cancelled tasks are dropped when they reach the top
 *
 * Not thread-safe; every call must come from the host's thread.
 */
class CadenceScheduler : public Scheduler {
public:
  explicit CadenceScheduler(std::shared_ptr<SchedulerHostConfig> host);
  ~CadenceScheduler() override;

  CadenceScheduler(const CadenceScheduler&) = delete;
  CadenceScheduler& operator=(const CadenceScheduler&) = delete;

  // Scheduler interface implementation
  TaskHandle scheduleCallback(
    SchedulerPriority priority,
    SchedulerCallback callback,
    const TaskOptions& options = {}) override;

  void cancelCallback(TaskHandle handle) override;

  SchedulerPriority getCurrentPriorityLevel() const override;

  TaskHandle getFirstCallbackNode() const override;

  bool shouldYield() const override;

  double now() const override;

  void requestPaint() override;

  // Convenience for bodies that always finish in one call
  TaskHandle scheduleTask(
    SchedulerPriority priority,
    Task task,
    const TaskOptions& options = {});

  void forceFrameRate(double fps);

  /**
   * Runs fn with the ambient priority set to priority and restores the
   * previous level afterwards, also when fn throws. Unknown levels run at
   * NormalPriority.
   */
  template <typename Fn>
  decltype(auto) runWithPriority(SchedulerPriority priority, Fn&& fn) {
    PriorityLevelScope scope(currentPriorityLevel_, normalizePriority(priority));
    return std::forward<Fn>(fn)();
  }

  // Shifts urgent ambient priorities down to NormalPriority for fn.
  template <typename Fn>
  decltype(auto) next(Fn&& fn) {
    SchedulerPriority priorityLevel = currentPriorityLevel_;
    switch (priorityLevel) {
      case SchedulerPriority::ImmediatePriority:
      case SchedulerPriority::UserBlockingPriority:
      case SchedulerPriority::NormalPriority:
        priorityLevel = SchedulerPriority::NormalPriority;
        break;
      default:
        break;
    }
    PriorityLevelScope scope(currentPriorityLevel_, priorityLevel);
    return std::forward<Fn>(fn)();
  }

  /**
   * Captures the ambient priority now; the returned callable re-establishes
   * it around every invocation of fn.
   */
  template <typename Fn>
  auto wrapCallback(Fn fn) {
    const SchedulerPriority parentPriorityLevel = currentPriorityLevel_;
    return [this, parentPriorityLevel, fn = std::move(fn)](auto&&... args) mutable -> decltype(auto) {
      PriorityLevelScope scope(currentPriorityLevel_, parentPriorityLevel);
      return fn(std::forward<decltype(args)>(args)...);
    };
  }

  void pauseExecution();
  void continueExecution();

  // Host callback entry point; returns true while work remains.
  bool flushWork(bool hasTimeRemaining, double initialTime);
  void handleTimeout(double currentTime);
  void advanceTimers(double currentTime);

  [[nodiscard]] std::size_t readyTaskCount() const;
  [[nodiscard]] std::size_t delayedTaskCount() const;
  [[nodiscard]] bool isTaskPending(TaskHandle handle) const;
  [[nodiscard]] bool isPaused() const;

  void setProfiler(std::shared_ptr<SchedulerProfiler> profiler);

private:
  class PriorityLevelScope {
  public:
    PriorityLevelScope(SchedulerPriority& slot, SchedulerPriority level)
      : slot_(slot), previous_(slot) {
      slot_ = level;
    }

    ~PriorityLevelScope() {
      slot_ = previous_;
    }

    PriorityLevelScope(const PriorityLevelScope&) = delete;
    PriorityLevelScope& operator=(const PriorityLevelScope&) = delete;

  private:
    SchedulerPriority& slot_;
    SchedulerPriority previous_;
  };

  SchedulerTask* createTask(
    SchedulerPriority priority,
    SchedulerCallback callback,
    double startTime,
    double expirationTime);

  bool workLoop(bool hasTimeRemaining, double initialTime);
  void finishFlush(SchedulerPriority previousPriorityLevel);
  void requestHostCallback();
  void requestHostTimeout(double ms);
  void cancelHostTimeout();
  void releaseTask(SchedulerTask* task);
  SchedulerTask* findTask(TaskHandle handle) const;

  std::shared_ptr<SchedulerHostConfig> host_;
  std::shared_ptr<SchedulerProfiler> profiler_{};

  // Task queues
  SchedulerMinHeap<SchedulerTask> taskQueue_;
  SchedulerMinHeap<SchedulerTask> timerQueue_;

  // Owns every task that is still in one of the queues
  std::unordered_map<uint64_t, std::unique_ptr<SchedulerTask>> taskStorage_;

  uint64_t nextTaskId_{1};
  SchedulerTask* currentTask_{nullptr};
  SchedulerPriority currentPriorityLevel_{SchedulerPriority::NormalPriority};

  bool isSchedulerPaused_{false};
  bool isPerformingWork_{false};
  bool isHostCallbackScheduled_{false};
  bool isHostTimeoutScheduled_{false};
};

} // namespace cadence
