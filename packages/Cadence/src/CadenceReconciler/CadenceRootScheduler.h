#pragma once

#include "CadenceReconciler/CadenceLane.h"
#include "CadenceScheduler/Scheduler.h"

#include <functional>

namespace cadence {

enum class RenderStatus {
  Completed,
  Yielded,
  Suspended,
};

struct RenderOutcome {
  RenderStatus status{RenderStatus::Completed};
  // Lanes the render left behind; only meaningful when Completed
  Lanes remainingLanes{};

  static RenderOutcome completed(Lanes remaining = NoLanes) {
    return RenderOutcome{RenderStatus::Completed, remaining};
  }

  static RenderOutcome yielded() {
    return RenderOutcome{RenderStatus::Yielded, NoLanes};
  }

  static RenderOutcome suspended() {
    return RenderOutcome{RenderStatus::Suspended, NoLanes};
  }
};

/**
 * Performs the actual work for a batch of lanes.
 * Implementations should poll shouldYield between units of work and return
 * Yielded when it reports true; the same lanes are offered again on the
 * next slice unless more urgent lanes arrived in between.
 */
class RootWorkDelegate {
public:
  virtual ~RootWorkDelegate() = default;

  virtual RenderOutcome renderLanes(
    LaneRegistry& root,
    Lanes lanes,
    const std::function<bool()>& shouldYield) = 0;
};

/**
 * Keeps at most one scheduler task per root, at the priority of the root's
 * next lanes. Roots and the delegate must outlive the tasks scheduled for
 * them.
 */
class CadenceRootScheduler {
public:
  CadenceRootScheduler(Scheduler& scheduler, RootWorkDelegate& delegate);

  CadenceRootScheduler(const CadenceRootScheduler&) = delete;
  CadenceRootScheduler& operator=(const CadenceRootScheduler&) = delete;

  void ensureRootIsScheduled(LaneRegistry& root, double currentTime);

  // Records an update on lane and makes sure the root has a task for it.
  void scheduleUpdateOnRoot(LaneRegistry& root, Lane lane, double eventTime);

  // Wakes suspended lanes once the data they waited on is available.
  void pingSuspendedRoot(LaneRegistry& root, Lanes pingedLanes);

  SchedulerCallbackResult performConcurrentWorkOnRoot(
    LaneRegistry& root,
    TaskHandle originalCallbackNode,
    bool didTimeout);

  // Drops the root's task and forgets any partial render of it.
  void cancelRoot(LaneRegistry& root);

  [[nodiscard]] const LaneRegistry* workInProgressRoot() const;
  [[nodiscard]] Lanes workInProgressRootRenderLanes() const;

private:
  void scheduleRootTask(LaneRegistry& root, LanePriority lanePriority);
  void resetWorkInProgress();

  Scheduler& scheduler_;
  RootWorkDelegate& delegate_;

  LaneRegistry* workInProgressRoot_{nullptr};
  Lanes workInProgressRootRenderLanes_{};
};

} // namespace cadence
