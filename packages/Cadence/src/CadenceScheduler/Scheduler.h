#pragma once

#include <cstdint>
#include <functional>

namespace cadence {

enum class SchedulerPriority : std::uint8_t {
  NoPriority = 0,
  ImmediatePriority = 1,
  UserBlockingPriority = 2,
  NormalPriority = 3,
  LowPriority = 4,
  IdlePriority = 5,
};

/**
 * Opaque reference to a scheduled task.
 * An empty handle (id 0) refers to no task.
 */
struct TaskHandle {
  std::uint64_t id{0};

  explicit operator bool() const {
    return id != 0;
  }

  bool operator==(const TaskHandle& other) const {
    return id == other.id;
  }

  bool operator!=(const TaskHandle& other) const {
    return id != other.id;
  }
};

struct TaskOptions {
  double delayMs{0.0};
};

struct SchedulerCallbackResult;

// Task callbacks receive didTimeout and report whether more work remains
using SchedulerCallback = std::function<SchedulerCallbackResult(bool)>;

struct SchedulerCallbackResult {
  bool hasContinuation{false};
  SchedulerCallback continuation{};

  static SchedulerCallbackResult done() {
    return SchedulerCallbackResult{};
  }

  static SchedulerCallbackResult continueWith(SchedulerCallback next) {
    SchedulerCallbackResult result;
    result.hasContinuation = static_cast<bool>(next);
    result.continuation = std::move(next);
    return result;
  }
};

using Task = std::function<void()>;

/**
 * Scheduling surface consumed by the root scheduler and the host bindings.
 */
class Scheduler {
public:
  virtual ~Scheduler() = default;

  virtual TaskHandle scheduleCallback(
    SchedulerPriority priority,
    SchedulerCallback callback,
    const TaskOptions& options = {}) = 0;

  virtual void cancelCallback(TaskHandle handle) = 0;

  virtual SchedulerPriority getCurrentPriorityLevel() const = 0;

  virtual TaskHandle getFirstCallbackNode() const = 0;

  virtual bool shouldYield() const = 0;

  virtual double now() const = 0;

  virtual void requestPaint() = 0;
};

} // namespace cadence
