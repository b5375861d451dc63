#pragma once

#include "CadenceScheduler/Scheduler.h"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cadence {

inline constexpr int TotalLanes = 31;

/**
 * Set of up to 31 lanes. Lower bit position means more urgent work.
 * A Lane is a Lanes value with at most one bit set.
 */
class Lanes {
public:
  constexpr Lanes() = default;

  static constexpr Lanes fromBits(std::uint32_t bits) {
    return Lanes(bits & kLaneMask);
  }

  static constexpr Lanes fromIndex(int index) {
    return index < 0 || index >= TotalLanes ? Lanes() : Lanes(std::uint32_t{1} << index);
  }

  constexpr std::uint32_t bits() const {
    return bits_;
  }

  constexpr bool empty() const {
    return bits_ == 0;
  }

  constexpr Lanes operator|(Lanes other) const {
    return Lanes(bits_ | other.bits_);
  }

  constexpr Lanes operator&(Lanes other) const {
    return Lanes(bits_ & other.bits_);
  }

  constexpr Lanes operator~() const {
    return Lanes(~bits_ & kLaneMask);
  }

  Lanes& operator|=(Lanes other) {
    bits_ |= other.bits_;
    return *this;
  }

  Lanes& operator&=(Lanes other) {
    bits_ &= other.bits_;
    return *this;
  }

  constexpr bool operator==(Lanes other) const {
    return bits_ == other.bits_;
  }

  constexpr bool operator!=(Lanes other) const {
    return bits_ != other.bits_;
  }

  // Numeric order of the masks; for single lanes, smaller is more urgent.
  constexpr bool operator<(Lanes other) const {
    return bits_ < other.bits_;
  }

private:
  static constexpr std::uint32_t kLaneMask = 0x7FFFFFFFu;

  explicit constexpr Lanes(std::uint32_t bits) : bits_(bits) {}

  std::uint32_t bits_{0};
};

using Lane = Lanes;

template <typename T>
using LaneMap = std::array<T, TotalLanes>;

// Lane priorities, higher is more urgent
using LanePriority = std::uint8_t;

inline constexpr LanePriority SyncLanePriority = 15;
inline constexpr LanePriority SyncBatchedLanePriority = 14;

inline constexpr LanePriority InputDiscreteHydrationLanePriority = 13;
inline constexpr LanePriority InputDiscreteLanePriority = 12;

inline constexpr LanePriority InputContinuousHydrationLanePriority = 11;
inline constexpr LanePriority InputContinuousLanePriority = 10;

inline constexpr LanePriority DefaultHydrationLanePriority = 9;
inline constexpr LanePriority DefaultLanePriority = 8;

inline constexpr LanePriority TransitionHydrationPriority = 7;
inline constexpr LanePriority TransitionPriority = 6;

inline constexpr LanePriority RetryLanePriority = 5;

inline constexpr LanePriority SelectiveHydrationLanePriority = 4;

inline constexpr LanePriority IdleHydrationLanePriority = 3;
inline constexpr LanePriority IdleLanePriority = 2;

inline constexpr LanePriority OffscreenLanePriority = 1;

inline constexpr LanePriority NoLanePriority = 0;

// Lane groups
inline constexpr Lanes NoLanes = Lanes::fromBits(0b0000000000000000000000000000000);
inline constexpr Lane NoLane = Lanes::fromBits(0b0000000000000000000000000000000);

inline constexpr Lane SyncLane = Lanes::fromBits(0b0000000000000000000000000000001);
inline constexpr Lane SyncBatchedLane = Lanes::fromBits(0b0000000000000000000000000000010);

inline constexpr Lane InputDiscreteHydrationLane = Lanes::fromBits(0b0000000000000000000000000000100);
inline constexpr Lanes InputDiscreteLanes = Lanes::fromBits(0b0000000000000000000000000011000);

inline constexpr Lane InputContinuousHydrationLane = Lanes::fromBits(0b0000000000000000000000000100000);
inline constexpr Lanes InputContinuousLanes = Lanes::fromBits(0b0000000000000000000000011000000);

inline constexpr Lane DefaultHydrationLane = Lanes::fromBits(0b0000000000000000000000100000000);
inline constexpr Lanes DefaultLanes = Lanes::fromBits(0b0000000000000000000111000000000);

inline constexpr Lane TransitionHydrationLane = Lanes::fromBits(0b0000000000000000001000000000000);
inline constexpr Lanes TransitionLanes = Lanes::fromBits(0b0000000001111111110000000000000);

inline constexpr Lanes RetryLanes = Lanes::fromBits(0b0000011110000000000000000000000);

inline constexpr Lane SomeRetryLane = Lanes::fromBits(0b0000010000000000000000000000000);

inline constexpr Lane SelectiveHydrationLane = Lanes::fromBits(0b0000100000000000000000000000000);

inline constexpr Lanes NonIdleLanes = Lanes::fromBits(0b0000111111111111111111111111111);

inline constexpr Lane IdleHydrationLane = Lanes::fromBits(0b0001000000000000000000000000000);
inline constexpr Lanes IdleLanes = Lanes::fromBits(0b0110000000000000000000000000000);

inline constexpr Lane OffscreenLane = Lanes::fromBits(0b1000000000000000000000000000000);

inline constexpr double NoTimestamp = -1.0;

// Thrown when lane bookkeeping reaches a state that should be impossible.
class LaneInvariantViolation : public std::logic_error {
public:
  explicit LaneInvariantViolation(const std::string& message)
    : std::logic_error(message) {}
};

struct LaneSelection {
  Lanes lanes{};
  LanePriority priority{NoLanePriority};
};

/**
 * Per-root lane registers.
 * After markRootFinished every lane set below is a subset of pendingLanes.
 */
struct LaneRegistry {
  Lanes pendingLanes{};
  Lanes suspendedLanes{};
  Lanes pingedLanes{};
  Lanes expiredLanes{};
  Lanes mutableReadLanes{};
  Lanes entangledLanes{};

  LaneMap<double> eventTimes{};
  LaneMap<double> expirationTimes{};
  LaneMap<Lanes> entanglements{};

  // Priority of the lanes returned by the last getNextLanes call
  LanePriority nextLanesPriority{NoLanePriority};

  // Scheduler task currently rendering this root, if any
  TaskHandle callbackNode{};
  LanePriority callbackPriority{NoLanePriority};

  LaneRegistry();
};

void resetLaneRegistry(LaneRegistry& root);

template <typename T>
LaneMap<T> createLaneMap(const T& initial) {
  LaneMap<T> map;
  map.fill(initial);
  return map;
}

// Bit primitives
constexpr int clz32(std::uint32_t value) {
  if (value == 0) {
    return 32;
  }
  int count = 0;
  while ((value & 0x80000000u) == 0) {
    value <<= 1;
    ++count;
  }
  return count;
}

constexpr Lane getHighestPriorityLane(Lanes lanes) {
  return Lanes::fromBits(lanes.bits() & (0u - lanes.bits()));
}

constexpr int pickArbitraryLaneIndex(Lanes lanes) {
  return 31 - clz32(lanes.bits());
}

constexpr Lane getLowestPriorityLane(Lanes lanes) {
  const int index = pickArbitraryLaneIndex(lanes);
  return index < 0 ? NoLanes : Lanes::fromIndex(index);
}

// Every lane at or above the least urgent lane in lanes
constexpr Lanes getEqualOrHigherPriorityLanes(Lanes lanes) {
  return Lanes::fromBits((getLowestPriorityLane(lanes).bits() << 1) - 1);
}

constexpr Lane pickArbitraryLane(Lanes lanes) {
  return getHighestPriorityLane(lanes);
}

constexpr int laneToIndex(Lane lane) {
  return pickArbitraryLaneIndex(lane);
}

constexpr bool includesSomeLane(Lanes a, Lanes b) {
  return !(a & b).empty();
}

constexpr bool isSubsetOfLanes(Lanes set, Lanes subset) {
  return (set & subset) == subset;
}

constexpr Lanes mergeLanes(Lanes a, Lanes b) {
  return a | b;
}

constexpr Lanes removeLanes(Lanes set, Lanes subset) {
  return set & ~subset;
}

constexpr Lanes laneToLanes(Lane lane) {
  return lane;
}

constexpr Lane higherPriorityLane(Lane a, Lane b) {
  return a != NoLane && a < b ? a : b;
}

constexpr LanePriority higherLanePriority(LanePriority a, LanePriority b) {
  return a != NoLanePriority && a > b ? a : b;
}

constexpr bool includesNonIdleWork(Lanes lanes) {
  return includesSomeLane(lanes, NonIdleLanes);
}

constexpr bool includesOnlyRetries(Lanes lanes) {
  return (lanes & RetryLanes) == lanes;
}

constexpr bool includesOnlyTransitions(Lanes lanes) {
  return (lanes & TransitionLanes) == lanes;
}

constexpr bool hasDiscreteLanes(Lanes lanes) {
  return includesSomeLane(lanes, InputDiscreteLanes);
}

// Classification
LaneSelection getHighestPriorityLanes(Lanes lanes);
LanePriority schedulerPriorityToLanePriority(SchedulerPriority schedulerPriorityLevel);
SchedulerPriority lanePriorityToSchedulerPriority(LanePriority lanePriority);

// Selection of the next batch
Lanes getNextLanes(LaneRegistry& root, Lanes wipLanes);
LanePriority returnNextLanesPriority(const LaneRegistry& root);
double getMostRecentEventTime(const LaneRegistry& root, Lanes lanes);
void markStarvedLanesAsExpired(LaneRegistry& root, double currentTime);
LaneSelection getHighestPriorityPendingLanes(const LaneRegistry& root);
Lanes getLanesToRetrySynchronouslyOnError(const LaneRegistry& root);

// Lanes for new work
Lane findUpdateLane(LanePriority lanePriority, Lanes wipLanes);
Lane findTransitionLane(Lanes wipLanes, Lanes pendingLanes);
Lane findRetryLane(Lanes wipLanes);
Lane getBumpedLaneForHydration(const LaneRegistry& root, Lanes renderLanes);

// Register updates
void markRootUpdated(LaneRegistry& root, Lane updateLane, double eventTime);
void markRootSuspended(LaneRegistry& root, Lanes suspendedLanes);
void markRootPinged(LaneRegistry& root, Lanes pingedLanes);
void markRootExpired(LaneRegistry& root, Lanes expiredLanes);
void markDiscreteUpdatesExpired(LaneRegistry& root);
void markRootMutableRead(LaneRegistry& root, Lane updateLane);
void markRootFinished(LaneRegistry& root, Lanes remainingLanes);
void markRootEntangled(LaneRegistry& root, Lanes entangledLanes);

} // namespace cadence
