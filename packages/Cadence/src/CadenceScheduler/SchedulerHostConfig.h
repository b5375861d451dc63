#pragma once

#include <functional>

namespace cadence {

/**
 * Platform capability injected into the scheduler.
 *
 * A host callback is invoked with (hasTimeRemaining, initialTime) and returns
 * true when it wants to be invoked again for the next slice. A host timeout is
 * invoked with the current time once its delay elapses. Only one host callback
 * and one host timeout are outstanding at a time; requesting a new one
 * replaces the previous one.
 */
class SchedulerHostConfig {
public:
  using HostCallback = std::function<bool(bool, double)>;
  using HostTimeoutCallback = std::function<void(double)>;

  virtual ~SchedulerHostConfig() = default;

  virtual double getCurrentTime() const = 0;

  virtual void requestHostCallback(HostCallback callback) = 0;
  virtual void cancelHostCallback() = 0;

  virtual void requestHostTimeout(HostTimeoutCallback callback, double ms) = 0;
  virtual void cancelHostTimeout() = 0;

  // True once the current slice has run out or a paint is pending
  virtual bool shouldYieldToHost() const = 0;

  virtual void requestPaint() = 0;

  // fps in [0, 125]; 0 restores the default slice length
  virtual void forceFrameRate(double fps) = 0;
};

// Shared frame-rate validation; returns false (and logs) when fps is rejected.
bool computeYieldInterval(double fps, double& yieldIntervalOut);

} // namespace cadence
