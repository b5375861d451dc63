#include "CadenceReconciler/CadenceLane.h"
#include "CadenceReconciler/CadenceRootScheduler.h"
#include "CadenceScheduler/CadenceScheduler.h"
#include "CadenceScheduler/SchedulerMessageLoopHost.h"
#include "shared/CadenceGlobalError.h"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>

using namespace cadence;

namespace {

// Renders a fixed list of work units per batch, 1ms each, giving the host a
// chance to run between units.
class ListRenderer : public RootWorkDelegate {
public:
  explicit ListRenderer(int unitsPerRender) : unitsPerRender_(unitsPerRender) {}

  RenderOutcome renderLanes(
      LaneRegistry& root,
      Lanes lanes,
      const std::function<bool()>& shouldYield) override {
    if (lanes != currentLanes_) {
      // Different batch: start over.
      currentLanes_ = lanes;
      unitsDone_ = 0;
      ++renders_;
    }

    while (unitsDone_ < unitsPerRender_) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++unitsDone_;
      if (unitsDone_ < unitsPerRender_ && shouldYield()) {
        ++yields_;
        return RenderOutcome::yielded();
      }
    }

    std::cout << "committed lanes 0x" << std::hex << lanes.bits() << std::dec
              << " at priority " << static_cast<int>(returnNextLanesPriority(root))
              << " after " << unitsDone_ << " units" << std::endl;
    currentLanes_ = NoLanes;
    return RenderOutcome::completed();
  }

  int renders() const {
    return renders_;
  }

  int yields() const {
    return yields_;
  }

private:
  int unitsPerRender_;
  Lanes currentLanes_{};
  int unitsDone_{0};
  int renders_{0};
  int yields_{0};
};

} // namespace

int main() {
  try {
    auto host = std::make_shared<SchedulerMessageLoopHost>();
    CadenceScheduler scheduler(host);
    auto profiler = std::make_shared<SchedulerProfiler>();
    scheduler.setProfiler(profiler);
    profiler->startLoggingProfilingEvents();

    ListRenderer renderer(40);
    CadenceRootScheduler rootScheduler(scheduler, renderer);
    LaneRegistry root;

    // A large transition starts rendering right away.
    const Lane transitionLane = findTransitionLane(NoLanes, root.pendingLanes);
    rootScheduler.scheduleUpdateOnRoot(root, transitionLane, scheduler.now());

    // A keystroke arrives while the transition is still rendering.
    host->setTimeout([&]() {
      const Lane inputLane = findUpdateLane(InputDiscreteLanePriority, rootScheduler.workInProgressRootRenderLanes());
      std::cout << "input event at " << scheduler.now() << "ms" << std::endl;
      rootScheduler.scheduleUpdateOnRoot(root, inputLane, scheduler.now());
    }, 12.0);

    // Low priority bookkeeping that should only run once the screen is idle.
    scheduler.scheduleTask(IdlePriority, []() {
      std::cout << "idle work ran" << std::endl;
    });

    host->run();

    if (!root.pendingLanes.empty()) {
      reportGlobalError("root still has pending lanes after the loop drained");
      return EXIT_FAILURE;
    }

    std::size_t taskRuns = 0;
    for (const SchedulerProfilingRecord& record : profiler->events()) {
      if (record.event == SchedulerProfilingEvent::TaskRun) {
        ++taskRuns;
      }
    }
    std::cout << "renders: " << renderer.renders()
              << ", yields: " << renderer.yields()
              << ", task runs: " << taskRuns << std::endl;
  } catch (const std::exception& ex) {
    reportGlobalError(ex);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
