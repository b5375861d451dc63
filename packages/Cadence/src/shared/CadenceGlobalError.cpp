#include "shared/CadenceGlobalError.h"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace cadence {

namespace {

GlobalErrorHandler& currentHandler() {
  static GlobalErrorHandler handler;
  return handler;
}

void appendNestedCauses(const std::exception& ex, std::string& message) {
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& cause) {
    message += ": ";
    message += cause.what();
    appendNestedCauses(cause, message);
  }
}

} // namespace

GlobalErrorHandler setGlobalErrorHandler(GlobalErrorHandler handler) {
  GlobalErrorHandler previous = std::move(currentHandler());
  currentHandler() = std::move(handler);
  return previous;
}

void reportGlobalError(const std::exception& ex) {
  std::string message = ex.what();
  appendNestedCauses(ex, message);
  reportGlobalError(message);
}

void reportGlobalError(const std::string& message) {
  const GlobalErrorHandler& handler = currentHandler();
  if (handler) {
    handler(message);
    return;
  }
  std::cerr << "Cadence global error: " << message << std::endl;
}

} // namespace cadence
