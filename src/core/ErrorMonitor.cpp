/* @file ErrorMonitor.cpp
 * @brief de-duplicating failure escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// AmpPoll headers
#include "core/ErrorMonitor.hpp"

using namespace amppoll::core;

void ErrorMonitor::registerEscalation(Escalation sink) {
  if (!sink)
    return;
  std::lock_guard<std::mutex> lock(mtx_);
  sinks_.push_back(std::move(sink));
}

void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

std::vector<std::string> ErrorMonitor::failures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

std::size_t ErrorMonitor::reportCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return reports_;
}

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::vector<Escalation> sinks;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++reports_;
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    seen_.push_back(message);
    sinks = sinks_;
  }
  // unlocked: a sink may log or report again
  for (const auto& sink : sinks)
    sink(message);
}
