#include "CadenceReconciler/CadenceRootScheduler.h"

#include <memory>

namespace cadence {

CadenceRootScheduler::CadenceRootScheduler(Scheduler& scheduler, RootWorkDelegate& delegate)
  : scheduler_(scheduler), delegate_(delegate) {
}

void CadenceRootScheduler::ensureRootIsScheduled(LaneRegistry& root, double currentTime) {
  const TaskHandle existingCallbackNode = root.callbackNode;

  // Check if any lanes are being starved by other work. If so, mark them as
  // expired so we know to work on those next.
  markStarvedLanesAsExpired(root, currentTime);

  const Lanes wipLanes = workInProgressRoot_ == &root ? workInProgressRootRenderLanes_ : NoLanes;
  const Lanes nextLanes = getNextLanes(root, wipLanes);
  const LanePriority newCallbackPriority = returnNextLanesPriority(root);

  if (nextLanes.empty()) {
    if (existingCallbackNode) {
      scheduler_.cancelCallback(existingCallbackNode);
    }
    root.callbackNode = {};
    root.callbackPriority = NoLanePriority;
    return;
  }

  if (existingCallbackNode) {
    if (root.callbackPriority == newCallbackPriority) {
      // The priority hasn't changed. We can reuse the existing task.
      return;
    }
    // The priority changed. Cancel the existing callback and schedule a new one.
    scheduler_.cancelCallback(existingCallbackNode);
  }

  scheduleRootTask(root, newCallbackPriority);
}

void CadenceRootScheduler::scheduleUpdateOnRoot(LaneRegistry& root, Lane lane, double eventTime) {
  markRootUpdated(root, lane, eventTime);
  ensureRootIsScheduled(root, scheduler_.now());
}

void CadenceRootScheduler::pingSuspendedRoot(LaneRegistry& root, Lanes pingedLanes) {
  markRootPinged(root, pingedLanes);
  ensureRootIsScheduled(root, scheduler_.now());
}

SchedulerCallbackResult CadenceRootScheduler::performConcurrentWorkOnRoot(
    LaneRegistry& root,
    TaskHandle originalCallbackNode,
    bool didTimeout) {

  if (root.callbackNode != originalCallbackNode) {
    return SchedulerCallbackResult::done();
  }

  markStarvedLanesAsExpired(root, scheduler_.now());

  const Lanes wipLanes = workInProgressRoot_ == &root ? workInProgressRootRenderLanes_ : NoLanes;
  const Lanes lanes = getNextLanes(root, wipLanes);
  if (lanes.empty()) {
    root.callbackNode = {};
    root.callbackPriority = NoLanePriority;
    return SchedulerCallbackResult::done();
  }

  workInProgressRoot_ = &root;
  workInProgressRootRenderLanes_ = lanes;

  // Expired work, or work whose task already timed out, renders without
  // yielding.
  const bool forceSync = didTimeout || includesSomeLane(lanes, root.expiredLanes);
  Scheduler& scheduler = scheduler_;
  const std::function<bool()> shouldYield = [&scheduler, forceSync]() {
    return !forceSync && scheduler.shouldYield();
  };

  RenderOutcome outcome;
  try {
    outcome = delegate_.renderLanes(root, lanes, shouldYield);
  } catch (...) {
    // The scheduler drops the failed task; make sure the next update
    // schedules a fresh one.
    resetWorkInProgress();
    root.callbackNode = {};
    root.callbackPriority = NoLanePriority;
    throw;
  }

  switch (outcome.status) {
    case RenderStatus::Completed:
      resetWorkInProgress();
      markRootFinished(root, removeLanes(root.pendingLanes, lanes) | outcome.remainingLanes);
      break;
    case RenderStatus::Suspended:
      resetWorkInProgress();
      markRootSuspended(root, lanes);
      break;
    case RenderStatus::Yielded:
      break;
  }

  ensureRootIsScheduled(root, scheduler_.now());

  if (root.callbackNode == originalCallbackNode) {
    // The task node scheduled for this root is the same one that's
    // currently executed. Need to return a continuation.
    return SchedulerCallbackResult::continueWith(
      [this, rootPtr = &root, originalCallbackNode](bool continuationDidTimeout) {
        return performConcurrentWorkOnRoot(*rootPtr, originalCallbackNode, continuationDidTimeout);
      });
  }
  return SchedulerCallbackResult::done();
}

void CadenceRootScheduler::cancelRoot(LaneRegistry& root) {
  if (root.callbackNode) {
    scheduler_.cancelCallback(root.callbackNode);
  }
  root.callbackNode = {};
  root.callbackPriority = NoLanePriority;
  if (workInProgressRoot_ == &root) {
    resetWorkInProgress();
  }
}

const LaneRegistry* CadenceRootScheduler::workInProgressRoot() const {
  return workInProgressRoot_;
}

Lanes CadenceRootScheduler::workInProgressRootRenderLanes() const {
  return workInProgressRootRenderLanes_;
}

void CadenceRootScheduler::scheduleRootTask(LaneRegistry& root, LanePriority lanePriority) {
  // The task needs its own handle to detect whether it is still current.
  auto callbackHandleBox = std::make_shared<TaskHandle>();
  LaneRegistry* rootPtr = &root;
  const TaskHandle handle = scheduler_.scheduleCallback(
    lanePriorityToSchedulerPriority(lanePriority),
    [this, rootPtr, callbackHandleBox](bool didTimeout) {
      return performConcurrentWorkOnRoot(*rootPtr, *callbackHandleBox, didTimeout);
    });
  *callbackHandleBox = handle;

  root.callbackNode = handle;
  root.callbackPriority = lanePriority;
}

void CadenceRootScheduler::resetWorkInProgress() {
  workInProgressRoot_ = nullptr;
  workInProgressRootRenderLanes_ = NoLanes;
}

} // namespace cadence
