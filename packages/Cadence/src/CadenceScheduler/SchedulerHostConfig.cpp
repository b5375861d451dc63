#include "CadenceScheduler/SchedulerHostConfig.h"
#include "CadenceScheduler/SchedulerFeatureFlags.h"

#include <cmath>
#include <iostream>

namespace cadence {

bool computeYieldInterval(double fps, double& yieldIntervalOut) {
  if (!(fps >= 0.0 && fps <= maxFrameRate)) {
    std::cerr
      << "forceFrameRate takes a positive int between 0 and 125, "
      << "forcing frame rates higher than 125 fps is not supported" << std::endl;
    return false;
  }

  if (fps > 0.0) {
    yieldIntervalOut = std::floor(1000.0 / fps);
  } else {
    // reset the framerate
    yieldIntervalOut = frameYieldMs;
  }
  return true;
}

} // namespace cadence
