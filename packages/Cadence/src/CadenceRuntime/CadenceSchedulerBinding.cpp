#include "CadenceRuntime/CadenceSchedulerBinding.h"

#include "CadenceScheduler/SchedulerPriorities.h"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace cadence {

namespace {

SchedulerPriority priorityFromValue(const jsi::Value& value) {
  if (!value.isNumber()) {
    return SchedulerPriority::NormalPriority;
  }
  const double number = value.asNumber();
  // Written so NaN also falls back to Normal.
  if (!(number >= 1.0 && number <= static_cast<double>(SchedulerPriority::IdlePriority))) {
    return SchedulerPriority::NormalPriority;
  }
  return normalizePriority(static_cast<SchedulerPriority>(static_cast<std::uint8_t>(number)));
}

// Ids are handed to JS as doubles, so only integers up to 2^53 can name a task.
TaskHandle taskHandleFromValue(const jsi::Value& value) {
  constexpr double maxExactInteger = 9007199254740992.0;
  if (!value.isNumber()) {
    return TaskHandle{};
  }
  const double number = value.asNumber();
  if (!(number >= 1.0 && number <= maxExactInteger) || std::floor(number) != number) {
    return TaskHandle{};
  }
  return TaskHandle{static_cast<std::uint64_t>(number)};
}

jsi::Value priorityToValue(SchedulerPriority priority) {
  return jsi::Value(static_cast<int>(priority));
}

std::shared_ptr<jsi::Function> requireFunction(
    jsi::Runtime& runtime,
    const jsi::Value* args,
    size_t count,
    size_t index,
    const char* methodName) {
  if (count <= index || !args[index].isObject() || !args[index].getObject(runtime).isFunction(runtime)) {
    throw jsi::JSError(runtime, std::string(methodName) + ": expected a function argument");
  }
  return std::make_shared<jsi::Function>(args[index].getObject(runtime).getFunction(runtime));
}

double delayFromOptions(jsi::Runtime& runtime, const jsi::Value* args, size_t count) {
  if (count < 3 || !args[2].isObject()) {
    return 0.0;
  }
  jsi::Value delay = args[2].getObject(runtime).getProperty(runtime, "delay");
  if (!delay.isNumber() || !std::isfinite(delay.asNumber()) || delay.asNumber() <= 0.0) {
    return 0.0;
  }
  return delay.asNumber();
}

SchedulerCallback makeJsCallback(jsi::Runtime& runtime, std::shared_ptr<jsi::Function> function) {
  jsi::Runtime* runtimePtr = &runtime;
  return [runtimePtr, function = std::move(function)](bool didTimeout) -> SchedulerCallbackResult {
    jsi::Runtime& rt = *runtimePtr;
    jsi::Value result = function->call(rt, jsi::Value(didTimeout));
    if (result.isObject()) {
      jsi::Object object = result.getObject(rt);
      if (object.isFunction(rt)) {
        return SchedulerCallbackResult::continueWith(
          makeJsCallback(rt, std::make_shared<jsi::Function>(object.getFunction(rt))));
      }
    }
    return SchedulerCallbackResult::done();
  };
}

void setMethod(
    jsi::Runtime& runtime,
    jsi::Object& target,
    const char* name,
    unsigned int paramCount,
    jsi::HostFunctionType body) {
  target.setProperty(
    runtime,
    name,
    jsi::Function::createFromHostFunction(runtime, jsi::PropNameID::forAscii(runtime, name), paramCount, std::move(body)));
}

} // namespace

void installSchedulerBinding(jsi::Runtime& runtime, std::shared_ptr<CadenceScheduler> scheduler) {
  if (!scheduler) {
    throw std::invalid_argument("installSchedulerBinding requires a scheduler");
  }

  jsi::Object binding(runtime);

  binding.setProperty(runtime, "unstable_ImmediatePriority", priorityToValue(ImmediatePriority));
  binding.setProperty(runtime, "unstable_UserBlockingPriority", priorityToValue(UserBlockingPriority));
  binding.setProperty(runtime, "unstable_NormalPriority", priorityToValue(NormalPriority));
  binding.setProperty(runtime, "unstable_LowPriority", priorityToValue(LowPriority));
  binding.setProperty(runtime, "unstable_IdlePriority", priorityToValue(IdlePriority));

  setMethod(runtime, binding, "unstable_scheduleCallback", 3,
    [scheduler](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) -> jsi::Value {
      const SchedulerPriority priority = count > 0 ? priorityFromValue(args[0]) : NormalPriority;
      auto function = requireFunction(rt, args, count, 1, "unstable_scheduleCallback");
      TaskOptions options;
      options.delayMs = delayFromOptions(rt, args, count);
      const TaskHandle handle = scheduler->scheduleCallback(priority, makeJsCallback(rt, std::move(function)), options);
      return jsi::Value(static_cast<double>(handle.id));
    });

  setMethod(runtime, binding, "unstable_cancelCallback", 1,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value* args, size_t count) -> jsi::Value {
      if (count > 0) {
        scheduler->cancelCallback(taskHandleFromValue(args[0]));
      }
      return jsi::Value::undefined();
    });

  setMethod(runtime, binding, "unstable_getCurrentPriorityLevel", 0,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      return priorityToValue(scheduler->getCurrentPriorityLevel());
    });

  setMethod(runtime, binding, "unstable_runWithPriority", 2,
    [scheduler](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) -> jsi::Value {
      const SchedulerPriority priority = count > 0 ? priorityFromValue(args[0]) : NormalPriority;
      auto function = requireFunction(rt, args, count, 1, "unstable_runWithPriority");
      return scheduler->runWithPriority(priority, [&rt, &function]() {
        return function->call(rt);
      });
    });

  setMethod(runtime, binding, "unstable_shouldYield", 0,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      return jsi::Value(scheduler->shouldYield());
    });

  setMethod(runtime, binding, "unstable_now", 0,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      return jsi::Value(scheduler->now());
    });

  setMethod(runtime, binding, "unstable_requestPaint", 0,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      scheduler->requestPaint();
      return jsi::Value::undefined();
    });

  setMethod(runtime, binding, "unstable_getFirstCallbackNode", 0,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      const TaskHandle first = scheduler->getFirstCallbackNode();
      if (!first) {
        return jsi::Value::null();
      }
      return jsi::Value(static_cast<double>(first.id));
    });

  setMethod(runtime, binding, "unstable_forceFrameRate", 1,
    [scheduler](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) -> jsi::Value {
      if (count == 0 || !args[0].isNumber()) {
        throw jsi::JSError(rt, "unstable_forceFrameRate: expected a number");
      }
      scheduler->forceFrameRate(args[0].asNumber());
      return jsi::Value::undefined();
    });

  setMethod(runtime, binding, "unstable_pauseExecution", 0,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      scheduler->pauseExecution();
      return jsi::Value::undefined();
    });

  setMethod(runtime, binding, "unstable_continueExecution", 0,
    [scheduler](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) -> jsi::Value {
      scheduler->continueExecution();
      return jsi::Value::undefined();
    });

  runtime.global().setProperty(runtime, kSchedulerBindingGlobalName, std::move(binding));
}

} // namespace cadence
