#include "CadenceReconciler/CadenceRootScheduler.h"
#include "CadenceScheduler/CadenceScheduler.h"
#include "CadenceScheduler/SchedulerMockHost.h"

#include <cassert>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cadence::test {

namespace {

constexpr Lane kDefaultLane = Lanes::fromIndex(9);
constexpr Lane kDefaultLane2 = Lanes::fromIndex(10);
constexpr Lane kTransitionLane = Lanes::fromIndex(13);

using RenderFn = std::function<RenderOutcome(LaneRegistry&, Lanes, const std::function<bool()>&)>;

class RecordingDelegate : public RootWorkDelegate {
public:
  RenderOutcome renderLanes(
      LaneRegistry& root,
      Lanes lanes,
      const std::function<bool()>& shouldYield) override {
    renders.push_back(lanes);
    callbackPriorities.push_back(root.callbackPriority);
    if (onRender) {
      return onRender(root, lanes, shouldYield);
    }
    return RenderOutcome::completed();
  }

  RenderFn onRender{};
  std::vector<Lanes> renders{};
  std::vector<LanePriority> callbackPriorities{};
};

struct RootFixture {
  std::shared_ptr<SchedulerMockHost> host{std::make_shared<SchedulerMockHost>()};
  CadenceScheduler scheduler{host};
  RecordingDelegate delegate{};
  CadenceRootScheduler rootScheduler{scheduler, delegate};
  LaneRegistry root{};
};

void testUpdateSchedulesSingleTask() {
  RootFixture fixture;

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane, fixture.scheduler.now());
  assert(fixture.root.callbackNode);
  assert(fixture.root.callbackPriority == DefaultLanePriority);
  assert(fixture.scheduler.readyTaskCount() == 1);

  // Another update at the same priority reuses the task.
  const TaskHandle handle = fixture.root.callbackNode;
  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane2, fixture.scheduler.now());
  assert(fixture.root.callbackNode == handle);
  assert(fixture.scheduler.readyTaskCount() == 1);

  fixture.host->flushAll();
  assert(fixture.delegate.renders.size() == 1);
  assert(fixture.delegate.renders[0] == (kDefaultLane | kDefaultLane2));
  assert(fixture.root.pendingLanes == NoLanes);
  assert(!fixture.root.callbackNode);
  assert(fixture.root.callbackPriority == NoLanePriority);
  assert(fixture.scheduler.readyTaskCount() == 0);
  assert(fixture.rootScheduler.workInProgressRoot() == nullptr);
}

void testPriorityChangeReschedules() {
  RootFixture fixture;

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane, 0.0);
  const TaskHandle defaultTask = fixture.root.callbackNode;

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, SyncLane, 0.0);
  assert(fixture.root.callbackNode != defaultTask);
  assert(fixture.root.callbackPriority == SyncLanePriority);
  assert(!fixture.scheduler.isTaskPending(defaultTask));
  assert(fixture.scheduler.getFirstCallbackNode() == fixture.root.callbackNode);

  fixture.host->flushAll();
  assert(fixture.delegate.renders.size() == 2);
  assert(fixture.delegate.renders[0] == SyncLane);
  assert(fixture.delegate.renders[1] == kDefaultLane);
  assert(fixture.delegate.callbackPriorities[1] == DefaultLanePriority);
  assert(fixture.root.pendingLanes == NoLanes);
  assert(fixture.scheduler.readyTaskCount() == 0);
}

void testSyncUpdateRunsAtImmediatePriority() {
  RootFixture fixture;
  std::vector<std::string> log;

  fixture.scheduler.scheduleTask(UserBlockingPriority, [&]() { log.emplace_back("user-blocking"); });
  fixture.delegate.onRender = [&](LaneRegistry&, Lanes, const std::function<bool()>&) {
    log.emplace_back("sync-render");
    return RenderOutcome::completed();
  };
  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, SyncLane, 0.0);
  assert(fixture.scheduler.getFirstCallbackNode() == fixture.root.callbackNode);

  fixture.host->flushAll();
  assert((log == std::vector<std::string>{"sync-render", "user-blocking"}));
}

void testYieldedRenderContinues() {
  RootFixture fixture;
  auto& host = *fixture.host;
  int unitsDone = 0;

  fixture.delegate.onRender = [&](LaneRegistry&, Lanes, const std::function<bool()>& shouldYield) {
    while (unitsDone < 4) {
      host.advanceTime(3.0);
      ++unitsDone;
      if (unitsDone < 4 && shouldYield()) {
        return RenderOutcome::yielded();
      }
    }
    return RenderOutcome::completed();
  };

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane, 0.0);
  const TaskHandle handle = fixture.root.callbackNode;

  assert(host.flushSlice());
  assert(unitsDone == 2);
  assert(fixture.root.callbackNode == handle);
  assert(fixture.rootScheduler.workInProgressRoot() == &fixture.root);
  assert(fixture.rootScheduler.workInProgressRootRenderLanes() == kDefaultLane);
  assert(fixture.scheduler.getFirstCallbackNode() == handle);

  assert(!host.flushSlice());
  assert(unitsDone == 4);
  assert(fixture.delegate.renders.size() == 2);
  assert(fixture.root.pendingLanes == NoLanes);
  assert(fixture.rootScheduler.workInProgressRoot() == nullptr);
}

void testUrgentUpdateInterruptsYieldedRender() {
  RootFixture fixture;
  auto& host = *fixture.host;

  fixture.delegate.onRender = [&](LaneRegistry&, Lanes lanes, const std::function<bool()>& shouldYield) {
    if (lanes == kDefaultLane && fixture.delegate.renders.size() == 1) {
      host.advanceTime(10.0);
      if (shouldYield()) {
        return RenderOutcome::yielded();
      }
    }
    return RenderOutcome::completed();
  };

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane, 0.0);
  const TaskHandle defaultTask = fixture.root.callbackNode;
  assert(host.flushSlice());

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, SyncLane, host.getCurrentTime());
  assert(fixture.root.callbackPriority == SyncLanePriority);
  assert(!fixture.scheduler.isTaskPending(defaultTask));

  host.flushAll();
  assert(fixture.delegate.renders.size() == 3);
  assert(fixture.delegate.renders[0] == kDefaultLane);
  assert(fixture.delegate.renders[1] == SyncLane);
  assert(fixture.delegate.renders[2] == kDefaultLane);
  assert(fixture.root.pendingLanes == NoLanes);
}

void testSuspendedRootWaitsForPing() {
  RootFixture fixture;
  bool dataReady = false;

  fixture.delegate.onRender = [&](LaneRegistry&, Lanes, const std::function<bool()>&) {
    return dataReady ? RenderOutcome::completed() : RenderOutcome::suspended();
  };

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kTransitionLane, 0.0);
  fixture.host->flushAll();

  assert(fixture.delegate.renders.size() == 1);
  assert(fixture.root.pendingLanes == kTransitionLane);
  assert(fixture.root.suspendedLanes == kTransitionLane);
  assert(!fixture.root.callbackNode);
  assert(!fixture.host->hasPendingCallback());

  dataReady = true;
  fixture.rootScheduler.pingSuspendedRoot(fixture.root, kTransitionLane);
  assert(fixture.root.callbackNode);
  assert(fixture.root.callbackPriority == TransitionPriority);

  fixture.host->flushAll();
  assert(fixture.delegate.renders.size() == 2);
  assert(fixture.root.pendingLanes == NoLanes);
  assert(fixture.root.suspendedLanes == NoLanes);
}

void testStarvedWorkRendersWithoutYielding() {
  RootFixture fixture;
  auto& host = *fixture.host;
  std::vector<bool> yieldAnswers;

  fixture.delegate.onRender = [&](LaneRegistry&, Lanes, const std::function<bool()>& shouldYield) {
    host.advanceTime(1000.0);
    const bool yield = shouldYield();
    yieldAnswers.push_back(yield);
    return yield ? RenderOutcome::yielded() : RenderOutcome::completed();
  };

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane, 0.0);
  host.flushAll();

  // Five slices yield; once the lane expires at 5000ms it is rescheduled
  // at sync priority and finishes in one go.
  assert(fixture.delegate.renders.size() == 6);
  assert(yieldAnswers.size() == 6);
  for (std::size_t index = 0; index < 5; ++index) {
    assert(yieldAnswers[index]);
    assert(fixture.delegate.callbackPriorities[index] == DefaultLanePriority);
  }
  assert(!yieldAnswers[5]);
  assert(fixture.delegate.callbackPriorities[5] == SyncLanePriority);
  assert(host.sliceCount() == 5);
  assert(fixture.root.pendingLanes == NoLanes);
  assert(fixture.root.expiredLanes == NoLanes);
  assert(fixture.scheduler.readyTaskCount() == 0);
}

void testCancelRoot() {
  RootFixture fixture;

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane, 0.0);
  const TaskHandle handle = fixture.root.callbackNode;
  fixture.rootScheduler.cancelRoot(fixture.root);

  assert(!fixture.root.callbackNode);
  assert(!fixture.scheduler.isTaskPending(handle));

  fixture.host->flushAll();
  assert(fixture.delegate.renders.empty());
  assert(fixture.root.pendingLanes == kDefaultLane);
}

void testRenderErrorAllowsReschedule() {
  RootFixture fixture;
  bool shouldThrow = true;

  fixture.delegate.onRender = [&](LaneRegistry&, Lanes, const std::function<bool()>&) {
    if (shouldThrow) {
      throw std::runtime_error("render failed");
    }
    return RenderOutcome::completed();
  };

  fixture.rootScheduler.scheduleUpdateOnRoot(fixture.root, kDefaultLane, 0.0);

  bool threw = false;
  try {
    fixture.host->flushSlice();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!fixture.root.callbackNode);
  assert(fixture.rootScheduler.workInProgressRoot() == nullptr);
  assert(fixture.root.pendingLanes == kDefaultLane);

  shouldThrow = false;
  fixture.rootScheduler.ensureRootIsScheduled(fixture.root, fixture.scheduler.now());
  assert(fixture.root.callbackNode);

  fixture.host->flushAll();
  assert(fixture.delegate.renders.size() == 2);
  assert(fixture.root.pendingLanes == NoLanes);
}

} // namespace

bool runCadenceRootSchedulerTests() {
  testUpdateSchedulesSingleTask();
  testPriorityChangeReschedules();
  testSyncUpdateRunsAtImmediatePriority();
  testYieldedRenderContinues();
  testUrgentUpdateInterruptsYieldedRender();
  testSuspendedRootWaitsForPing();
  testStarvedWorkRendersWithoutYielding();
  testCancelRoot();
  testRenderErrorAllowsReschedule();
  return true;
}

} // namespace cadence::test
