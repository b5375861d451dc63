#pragma once

namespace cadence {

// Durations are in milliseconds.

// Length of one host slice unless forceFrameRate overrides it
inline constexpr double frameYieldMs = 5.0;
inline constexpr double maxFrameRate = 125.0;

// Expiration offsets per priority level
inline constexpr double immediatePriorityTimeout = -1.0;
inline constexpr double userBlockingPriorityTimeout = 250.0;
inline constexpr double normalPriorityTimeout = 5000.0;
inline constexpr double lowPriorityTimeout = 10000.0;
inline constexpr double maxSigned31BitInt = 1073741823.0;
inline constexpr double idlePriorityTimeout = maxSigned31BitInt;

// requestPaint() ends the current slice early
inline constexpr bool enableRequestPaint = true;

// pauseExecution()/continueExecution() are honoured only when set
inline constexpr bool enableSchedulerDebugging = true;

} // namespace cadence
