#pragma once

#include "CadenceScheduler/SchedulerFeatureFlags.h"
#include "CadenceScheduler/SchedulerHostConfig.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace cadence {

/**
 * Single-threaded message loop host.
 *
 * Host callbacks are driven by posting performWorkUntilDeadline as a message
 * after every slice that reports more work, so other messages and due timers
 * interleave with scheduler slices. Time is measured with steady_clock in
 * milliseconds since construction.
 */
class SchedulerMessageLoopHost : public SchedulerHostConfig {
public:
  using Message = std::function<void()>;
  using TimerId = std::uint64_t;

  SchedulerMessageLoopHost();
  ~SchedulerMessageLoopHost() override = default;

  double getCurrentTime() const override;

  void requestHostCallback(HostCallback callback) override;
  void cancelHostCallback() override;

  void requestHostTimeout(HostTimeoutCallback callback, double ms) override;
  void cancelHostTimeout() override;

  bool shouldYieldToHost() const override;
  void requestPaint() override;
  void forceFrameRate(double fps) override;

  void postMessage(Message message);
  TimerId setTimeout(Message callback, double ms);
  void clearTimeout(TimerId id);

  // Runs one due timer or one message, sleeping until the next timer when
  // only timers remain. Returns false when the loop is idle. Exceptions
  // thrown by the unit of work propagate.
  bool runOnce();

  // Pumps until idle or stop(); errors escaping a message are reported
  // through reportGlobalError and the loop keeps going.
  void run();
  void stop();

  [[nodiscard]] bool hasPendingWork() const;
  [[nodiscard]] double yieldInterval() const;

private:
  struct Timer {
    TimerId id;
    double dueTime;
    Message callback;
  };

  void performWorkUntilDeadline();
  void schedulePerformWorkUntilDeadline();
  std::vector<Timer>::iterator findEarliestTimer();

  std::deque<Message> messages_{};
  std::vector<Timer> timers_{};
  HostCallback scheduledHostCallback_{};
  bool isMessageLoopRunning_{false};
  TimerId taskTimeoutId_{0};
  TimerId nextTimerId_{1};

  double yieldInterval_{frameYieldMs};
  double deadline_{0.0};
  bool needsPaint_{false};
  bool stopRequested_{false};

  std::chrono::steady_clock::time_point baseTime_;
};

} // namespace cadence
