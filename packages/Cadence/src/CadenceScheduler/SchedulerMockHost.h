#pragma once

#include "CadenceScheduler/SchedulerFeatureFlags.h"
#include "CadenceScheduler/SchedulerHostConfig.h"

#include <cstddef>

namespace cadence {

/**
 * Virtual-time host for deterministic tests and simulations.
 *
 * Nothing runs until the owner flushes slices or advances time. Time only
 * moves through advanceTime(), so a task that wants to model a long body
 * advances the clock itself.
 */
class SchedulerMockHost : public SchedulerHostConfig {
public:
  static constexpr std::size_t kMaxFlushSlices = 10000;

  SchedulerMockHost() = default;
  ~SchedulerMockHost() override = default;

  double getCurrentTime() const override;

  void requestHostCallback(HostCallback callback) override;
  void cancelHostCallback() override;

  void requestHostTimeout(HostTimeoutCallback callback, double ms) override;
  void cancelHostTimeout() override;

  bool shouldYieldToHost() const override;
  void requestPaint() override;
  void forceFrameRate(double fps) override;

  // Moves the clock forward and fires the host timeout once it is due.
  void advanceTime(double ms);

  // Runs a single slice; returns true when the callback asked for another.
  // If the slice throws, the callback stays scheduled and the error
  // propagates.
  bool flushSlice();

  // Runs slices until no host callback remains scheduled.
  void flushAll();

  // Fires the pending host timeout immediately, regardless of its due time.
  bool runTimeout();

  void setShouldYieldNow(bool shouldYield);

  [[nodiscard]] bool hasPendingCallback() const;
  [[nodiscard]] bool hasPendingTimeout() const;
  [[nodiscard]] double pendingTimeoutTime() const;
  [[nodiscard]] bool needsPaint() const;
  [[nodiscard]] double yieldInterval() const;
  [[nodiscard]] std::size_t sliceCount() const;

private:
  void fireTimeoutIfDue();

  double currentTime_{0.0};
  HostCallback scheduledCallback_{};
  HostTimeoutCallback scheduledTimeout_{};
  double timeoutTime_{-1.0};

  double yieldInterval_{frameYieldMs};
  double deadline_{0.0};
  bool needsPaint_{false};
  bool shouldYieldNow_{false};
  bool isFlushing_{false};
  std::size_t sliceCount_{0};
};

} // namespace cadence
