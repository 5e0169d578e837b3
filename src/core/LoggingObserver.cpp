/* @file LoggingObserver.cpp
 * @brief progress events -> Logger lines
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <sstream>

// AmpPoll headers
#include "core/LoggingObserver.hpp"

using namespace amppoll::core;
using amppoll::protocols::ExecutionStatus;

LoggingObserver::LoggingObserver(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {
  assert(logger_ && "[LoggingObserver] logger is nullptr");
}

void LoggingObserver::onStep(const ProgressEvent& event) {
  std::ostringstream os;
  os << event.task << " #" << event.stepIndex << " '" << event.command << "' " << protocols::toString(event.status)
     << " in " << event.elapsed.count() << " ms";
  if (event.attempt > 1)
    os << " (attempt " << event.attempt << ")";

  const LogLevel level = event.status == ExecutionStatus::Complete ? LogLevel::Debug : LogLevel::Warning;
  logger_->log(level, event.deviceKey, os.str());
}

void LoggingObserver::onDeviceFinished(const DeviceSummary& summary) {
  for (const auto& task : summary.tasks) {
    std::string line = "task " + task.name + ": " + toString(task.status);
    if (task.detail)
      line += " (" + *task.detail + ")";
    logger_->log(task.status == TaskStatus::Complete ? LogLevel::Info : LogLevel::Warning, summary.deviceKey, line);
  }

  std::ostringstream os;
  os << "device " << toString(summary.outcome) << " after " << summary.elapsed.count() << " ms";
  if (summary.failedAtStep)
    os << ", failed at step " << *summary.failedAtStep;
  if (summary.haltedBy)
    os << ", halted by critical task " << *summary.haltedBy;
  if (summary.persistError)
    os << ", state not saved: " << *summary.persistError;
  logger_->log(summary.outcome == DeviceOutcome::Complete ? LogLevel::Info : LogLevel::Error, summary.deviceKey,
               os.str());
}
