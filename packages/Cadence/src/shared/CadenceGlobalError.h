#pragma once

#include <exception>
#include <functional>
#include <string>

namespace cadence {

using GlobalErrorHandler = std::function<void(const std::string& message)>;

// Replaces the process-wide handler and returns the previous one. An empty
// handler restores the default, which writes to std::cerr.
GlobalErrorHandler setGlobalErrorHandler(GlobalErrorHandler handler);

// Reports an error that escaped a host message. Nested exceptions are
// flattened into "outer: inner".
void reportGlobalError(const std::exception& ex);
void reportGlobalError(const std::string& message);

} // namespace cadence
