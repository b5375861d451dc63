#include "CadenceReconciler/CadenceLane.h"

#include <string>

namespace cadence {

namespace {

[[noreturn]] void throwInvalidUpdatePriority(LanePriority lanePriority) {
  throw LaneInvariantViolation(
    "Invalid update priority: " + std::to_string(static_cast<int>(lanePriority)) + ". This is a bug in Cadence.");
}

double computeExpirationTime(Lane lane, double currentTime) {
  const LanePriority priority = getHighestPriorityLanes(lane).priority;

  // Input-like updates should expire quickly so interactions stay
  // responsive; transitions may wait longer.
  if (priority >= InputContinuousLanePriority) {
    return currentTime + 250.0;
  }
  if (priority >= TransitionPriority) {
    return currentTime + 5000.0;
  }
  // Retries, idle and offscreen work never expire.
  return NoTimestamp;
}

} // namespace

LaneRegistry::LaneRegistry()
  : eventTimes(createLaneMap(NoTimestamp)),
    expirationTimes(createLaneMap(NoTimestamp)),
    entanglements(createLaneMap(NoLanes)) {
}

void resetLaneRegistry(LaneRegistry& root) {
  root = LaneRegistry{};
}

LaneSelection getHighestPriorityLanes(Lanes lanes) {
  if (lanes.empty()) {
    return {NoLanes, NoLanePriority};
  }
  if (includesSomeLane(SyncLane, lanes)) {
    return {SyncLane, SyncLanePriority};
  }
  if (includesSomeLane(SyncBatchedLane, lanes)) {
    return {SyncBatchedLane, SyncBatchedLanePriority};
  }
  if (includesSomeLane(InputDiscreteHydrationLane, lanes)) {
    return {InputDiscreteHydrationLane, InputDiscreteHydrationLanePriority};
  }
  const Lanes inputDiscreteLanes = InputDiscreteLanes & lanes;
  if (!inputDiscreteLanes.empty()) {
    return {inputDiscreteLanes, InputDiscreteLanePriority};
  }
  if (includesSomeLane(lanes, InputContinuousHydrationLane)) {
    return {InputContinuousHydrationLane, InputContinuousHydrationLanePriority};
  }
  const Lanes inputContinuousLanes = InputContinuousLanes & lanes;
  if (!inputContinuousLanes.empty()) {
    return {inputContinuousLanes, InputContinuousLanePriority};
  }
  if (includesSomeLane(lanes, DefaultHydrationLane)) {
    return {DefaultHydrationLane, DefaultHydrationLanePriority};
  }
  const Lanes defaultLanes = DefaultLanes & lanes;
  if (!defaultLanes.empty()) {
    return {defaultLanes, DefaultLanePriority};
  }
  if (includesSomeLane(lanes, TransitionHydrationLane)) {
    return {TransitionHydrationLane, TransitionHydrationPriority};
  }
  const Lanes transitionLanes = TransitionLanes & lanes;
  if (!transitionLanes.empty()) {
    return {transitionLanes, TransitionPriority};
  }
  const Lanes retryLanes = RetryLanes & lanes;
  if (!retryLanes.empty()) {
    return {retryLanes, RetryLanePriority};
  }
  if (includesSomeLane(lanes, SelectiveHydrationLane)) {
    return {SelectiveHydrationLane, SelectiveHydrationLanePriority};
  }
  if (includesSomeLane(lanes, IdleHydrationLane)) {
    return {IdleHydrationLane, IdleHydrationLanePriority};
  }
  const Lanes idleLanes = IdleLanes & lanes;
  if (!idleLanes.empty()) {
    return {idleLanes, IdleLanePriority};
  }
  if (includesSomeLane(OffscreenLane, lanes)) {
    return {OffscreenLane, OffscreenLanePriority};
  }
  throw LaneInvariantViolation(
    "Should have found matching lanes for " + std::to_string(lanes.bits()) + ". This is a bug in Cadence.");
}

LanePriority schedulerPriorityToLanePriority(SchedulerPriority schedulerPriorityLevel) {
  switch (schedulerPriorityLevel) {
    case SchedulerPriority::ImmediatePriority:
      return SyncLanePriority;
    case SchedulerPriority::UserBlockingPriority:
      return InputContinuousLanePriority;
    case SchedulerPriority::NormalPriority:
    case SchedulerPriority::LowPriority:
      // Low has no lane group of its own; it shares the Default lanes.
      return DefaultLanePriority;
    case SchedulerPriority::IdlePriority:
      return IdleLanePriority;
    default:
      return NoLanePriority;
  }
}

SchedulerPriority lanePriorityToSchedulerPriority(LanePriority lanePriority) {
  switch (lanePriority) {
    case SyncLanePriority:
    case SyncBatchedLanePriority:
      return SchedulerPriority::ImmediatePriority;
    case InputDiscreteHydrationLanePriority:
    case InputDiscreteLanePriority:
    case InputContinuousHydrationLanePriority:
    case InputContinuousLanePriority:
      return SchedulerPriority::UserBlockingPriority;
    case DefaultHydrationLanePriority:
    case DefaultLanePriority:
    case TransitionHydrationPriority:
    case TransitionPriority:
    case SelectiveHydrationLanePriority:
    case RetryLanePriority:
      return SchedulerPriority::NormalPriority;
    case IdleHydrationLanePriority:
    case IdleLanePriority:
    case OffscreenLanePriority:
      return SchedulerPriority::IdlePriority;
    case NoLanePriority:
      return SchedulerPriority::NoPriority;
    default:
      throwInvalidUpdatePriority(lanePriority);
  }
}

Lanes getNextLanes(LaneRegistry& root, Lanes wipLanes) {
  const Lanes pendingLanes = root.pendingLanes;

  // Early bailout if there's no pending work left.
  if (pendingLanes.empty()) {
    root.nextLanesPriority = NoLanePriority;
    return NoLanes;
  }

  Lanes nextLanes = NoLanes;
  LanePriority nextLanePriority = NoLanePriority;

  const Lanes expiredLanes = root.expiredLanes;
  const Lanes suspendedLanes = root.suspendedLanes;
  const Lanes pingedLanes = root.pingedLanes;

  if (!expiredLanes.empty()) {
    // Starved lanes are rendered synchronously, ahead of everything else.
    nextLanes = expiredLanes;
    nextLanePriority = SyncLanePriority;
  } else {
    // Do not work on any idle work until all the non-idle work has finished,
    // even if the work is suspended.
    const Lanes nonIdlePendingLanes = pendingLanes & NonIdleLanes;
    LaneSelection selection{};
    if (!nonIdlePendingLanes.empty()) {
      const Lanes nonIdleUnblockedLanes = nonIdlePendingLanes & ~suspendedLanes;
      if (!nonIdleUnblockedLanes.empty()) {
        selection = getHighestPriorityLanes(nonIdleUnblockedLanes);
      } else {
        const Lanes nonIdlePingedLanes = nonIdlePendingLanes & pingedLanes;
        if (!nonIdlePingedLanes.empty()) {
          selection = getHighestPriorityLanes(nonIdlePingedLanes);
        }
      }
    } else {
      // The only remaining work is Idle.
      const Lanes unblockedLanes = pendingLanes & ~suspendedLanes;
      if (!unblockedLanes.empty()) {
        selection = getHighestPriorityLanes(unblockedLanes);
      } else if (!pingedLanes.empty()) {
        selection = getHighestPriorityLanes(pingedLanes);
      }
    }
    nextLanes = selection.lanes;
    nextLanePriority = selection.priority;
  }

  if (nextLanes.empty()) {
    // This should only be reachable if we're suspended
    root.nextLanesPriority = NoLanePriority;
    return NoLanes;
  }

  // Render every pending lane at the chosen priority or above as one batch.
  nextLanes = pendingLanes & getEqualOrHigherPriorityLanes(nextLanes);

  // If we're already in the middle of a render, switching lanes will
  // interrupt it and we'll lose our progress. Only do that if the new lanes
  // are more urgent.
  if (!wipLanes.empty() && wipLanes != nextLanes && (wipLanes & suspendedLanes).empty()) {
    const LanePriority wipLanePriority = getHighestPriorityLanes(wipLanes).priority;
    if (nextLanePriority <= wipLanePriority) {
      root.nextLanesPriority = wipLanePriority;
      return wipLanes;
    }
  }
  root.nextLanesPriority = nextLanePriority;

  // Entangled lanes are always rendered together so that updates from one
  // source never show up partially.
  const Lanes entangledLanes = root.entangledLanes;
  if (!entangledLanes.empty()) {
    Lanes lanes = nextLanes & entangledLanes;
    while (!lanes.empty()) {
      const int index = pickArbitraryLaneIndex(lanes);
      const Lane lane = Lanes::fromIndex(index);

      nextLanes |= root.entanglements[index];

      lanes &= ~lane;
    }
  }

  return nextLanes;
}

LanePriority returnNextLanesPriority(const LaneRegistry& root) {
  return root.nextLanesPriority;
}

double getMostRecentEventTime(const LaneRegistry& root, Lanes lanes) {
  double mostRecentEventTime = NoTimestamp;
  while (!lanes.empty()) {
    const int index = pickArbitraryLaneIndex(lanes);
    const Lane lane = Lanes::fromIndex(index);

    const double eventTime = root.eventTimes[index];
    if (eventTime > mostRecentEventTime) {
      mostRecentEventTime = eventTime;
    }

    lanes &= ~lane;
  }
  return mostRecentEventTime;
}

void markStarvedLanesAsExpired(LaneRegistry& root, double currentTime) {
  const Lanes pendingLanes = root.pendingLanes;
  const Lanes suspendedLanes = root.suspendedLanes;
  const Lanes pingedLanes = root.pingedLanes;

  Lanes lanes = pendingLanes;
  while (!lanes.empty()) {
    const int index = pickArbitraryLaneIndex(lanes);
    const Lane lane = Lanes::fromIndex(index);

    const double expirationTime = root.expirationTimes[index];
    if (expirationTime == NoTimestamp) {
      // Suspended lanes get no expiration time unless they were pinged.
      if (!includesSomeLane(lane, suspendedLanes) || includesSomeLane(lane, pingedLanes)) {
        root.expirationTimes[index] = computeExpirationTime(lane, currentTime);
      }
    } else if (expirationTime <= currentTime) {
      // This lane expired
      root.expiredLanes |= lane;
    }

    lanes &= ~lane;
  }
}

LaneSelection getHighestPriorityPendingLanes(const LaneRegistry& root) {
  return getHighestPriorityLanes(root.pendingLanes);
}

Lanes getLanesToRetrySynchronouslyOnError(const LaneRegistry& root) {
  const Lanes everythingButOffscreen = root.pendingLanes & ~OffscreenLane;
  if (!everythingButOffscreen.empty()) {
    return everythingButOffscreen;
  }
  if (includesSomeLane(root.pendingLanes, OffscreenLane)) {
    return OffscreenLane;
  }
  return NoLanes;
}

Lane findUpdateLane(LanePriority lanePriority, Lanes wipLanes) {
  switch (lanePriority) {
    case SyncLanePriority:
      return SyncLane;
    case SyncBatchedLanePriority:
      return SyncBatchedLane;
    case InputDiscreteLanePriority: {
      const Lane lane = pickArbitraryLane(InputDiscreteLanes & ~wipLanes);
      if (lane == NoLane) {
        // Shift to the next priority level
        return findUpdateLane(InputContinuousLanePriority, wipLanes);
      }
      return lane;
    }
    case InputContinuousLanePriority: {
      const Lane lane = pickArbitraryLane(InputContinuousLanes & ~wipLanes);
      if (lane == NoLane) {
        return findUpdateLane(DefaultLanePriority, wipLanes);
      }
      return lane;
    }
    case DefaultLanePriority: {
      Lane lane = pickArbitraryLane(DefaultLanes & ~wipLanes);
      if (lane == NoLane) {
        // If all the default lanes are taken, use a transition lane before
        // interrupting the render that is already in progress.
        lane = pickArbitraryLane(TransitionLanes & ~wipLanes);
        if (lane == NoLane) {
          // All the transition lanes are taken, too.
          lane = pickArbitraryLane(DefaultLanes);
        }
      }
      return lane;
    }
    case IdleLanePriority: {
      Lane lane = pickArbitraryLane(IdleLanes & ~wipLanes);
      if (lane == NoLane) {
        lane = pickArbitraryLane(IdleLanes);
      }
      return lane;
    }
    // Transitions and retries have dedicated finders.
    default:
      break;
  }
  throwInvalidUpdatePriority(lanePriority);
}

Lane findTransitionLane(Lanes wipLanes, Lanes pendingLanes) {
  // First look for lanes that are completely unclaimed.
  Lane lane = pickArbitraryLane(TransitionLanes & ~pendingLanes);
  if (lane == NoLane) {
    // Then any lane that isn't being rendered right now.
    lane = pickArbitraryLane(TransitionLanes & ~wipLanes);
    if (lane == NoLane) {
      lane = pickArbitraryLane(TransitionLanes);
    }
  }
  return lane;
}

Lane findRetryLane(Lanes wipLanes) {
  Lane lane = pickArbitraryLane(RetryLanes & ~wipLanes);
  if (lane == NoLane) {
    lane = pickArbitraryLane(RetryLanes);
  }
  return lane;
}

Lane getBumpedLaneForHydration(const LaneRegistry& root, Lanes renderLanes) {
  const LanePriority highestLanePriority = getHighestPriorityLanes(renderLanes).priority;

  Lane lane = NoLane;
  switch (highestLanePriority) {
    case SyncLanePriority:
    case SyncBatchedLanePriority:
      lane = NoLane;
      break;
    case InputDiscreteHydrationLanePriority:
    case InputDiscreteLanePriority:
      lane = InputDiscreteHydrationLane;
      break;
    case InputContinuousHydrationLanePriority:
    case InputContinuousLanePriority:
      lane = InputContinuousHydrationLane;
      break;
    case DefaultHydrationLanePriority:
    case DefaultLanePriority:
      lane = DefaultHydrationLane;
      break;
    case TransitionHydrationPriority:
    case TransitionPriority:
    case RetryLanePriority:
      lane = TransitionHydrationLane;
      break;
    case SelectiveHydrationLanePriority:
      lane = SelectiveHydrationLane;
      break;
    case IdleHydrationLanePriority:
    case IdleLanePriority:
      lane = IdleHydrationLane;
      break;
    case OffscreenLanePriority:
    case NoLanePriority:
      lane = NoLane;
      break;
    default:
      throwInvalidUpdatePriority(highestLanePriority);
  }

  // Already suspended or already rendering at this level.
  if (includesSomeLane(lane, root.suspendedLanes | renderLanes)) {
    return NoLane;
  }
  return lane;
}

void markRootUpdated(LaneRegistry& root, Lane updateLane, double eventTime) {
  root.pendingLanes |= updateLane;

  // An update may unblock anything at its priority or below that was
  // suspended, so clear suspension for those lanes. Higher priority lanes
  // stay suspended; this update can't unblock them.
  const Lanes higherPriorityLanes = Lanes::fromBits(updateLane.bits() - 1); // Turns 0b1000 into 0b0111

  root.suspendedLanes &= higherPriorityLanes;
  root.pingedLanes &= higherPriorityLanes;

  const int index = laneToIndex(updateLane);
  if (index >= 0) {
    root.eventTimes[index] = eventTime;
  }
}

void markRootSuspended(LaneRegistry& root, Lanes suspendedLanes) {
  root.suspendedLanes |= suspendedLanes;
  root.pingedLanes &= ~suspendedLanes;

  // The expiration time is recomputed once the lane is pinged.
  Lanes lanes = suspendedLanes;
  while (!lanes.empty()) {
    const int index = pickArbitraryLaneIndex(lanes);
    const Lane lane = Lanes::fromIndex(index);

    root.expirationTimes[index] = NoTimestamp;

    lanes &= ~lane;
  }
}

void markRootPinged(LaneRegistry& root, Lanes pingedLanes) {
  root.pingedLanes |= root.suspendedLanes & pingedLanes;
}

void markRootExpired(LaneRegistry& root, Lanes expiredLanes) {
  root.expiredLanes |= expiredLanes & root.pendingLanes;
}

void markDiscreteUpdatesExpired(LaneRegistry& root) {
  root.expiredLanes |= InputDiscreteLanes & root.pendingLanes;
}

void markRootMutableRead(LaneRegistry& root, Lane updateLane) {
  root.mutableReadLanes |= updateLane & root.pendingLanes;
}

void markRootFinished(LaneRegistry& root, Lanes remainingLanes) {
  const Lanes noLongerPendingLanes = root.pendingLanes & ~remainingLanes;

  root.pendingLanes = remainingLanes;

  // Let's try everything again
  root.suspendedLanes = NoLanes;
  root.pingedLanes = NoLanes;

  root.expiredLanes &= remainingLanes;
  root.mutableReadLanes &= remainingLanes;
  root.entangledLanes &= remainingLanes;

  Lanes lanes = noLongerPendingLanes;
  while (!lanes.empty()) {
    const int index = pickArbitraryLaneIndex(lanes);
    const Lane lane = Lanes::fromIndex(index);

    root.entanglements[index] = NoLanes;
    root.eventTimes[index] = NoTimestamp;
    root.expirationTimes[index] = NoTimestamp;

    lanes &= ~lane;
  }
}

void markRootEntangled(LaneRegistry& root, Lanes entangledLanes) {
  root.entangledLanes |= entangledLanes;

  Lanes lanes = entangledLanes;
  while (!lanes.empty()) {
    const int index = pickArbitraryLaneIndex(lanes);
    const Lane lane = Lanes::fromIndex(index);

    root.entanglements[index] |= entangledLanes;

    lanes &= ~lane;
  }
}

} // namespace cadence
