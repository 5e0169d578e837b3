/* @file RunReport.cpp
 * @brief status names + completion predicates
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// AmpPoll headers
#include "core/RunReport.hpp"

using namespace amppoll::core;

const char* amppoll::core::toString(TaskStatus s) {
  switch (s) {
  case TaskStatus::Pending:
    return "Pending";
  case TaskStatus::Complete:
    return "Complete";
  case TaskStatus::Failed:
    return "Failed";
  case TaskStatus::Timeout:
    return "Timeout";
  case TaskStatus::Aborted:
    return "Aborted";
  case TaskStatus::Skipped:
    return "Skipped";
  case TaskStatus::MissingArtifact:
    return "MissingArtifact";
  case TaskStatus::EmptyArtifact:
    return "EmptyArtifact";
  case TaskStatus::Mismatch:
    return "Mismatch";
  default:
    return "Unknown";
  }
}

const char* amppoll::core::toString(DeviceOutcome o) {
  switch (o) {
  case DeviceOutcome::Complete:
    return "Complete";
  case DeviceOutcome::Failed:
    return "Failed";
  case DeviceOutcome::Aborted:
    return "Aborted";
  default:
    return "Unknown";
  }
}

bool DeviceSummary::allTasksComplete() const {
  return std::all_of(tasks.begin(), tasks.end(),
                     [](const TaskSummary& t) { return t.status == TaskStatus::Complete; });
}

bool RunReport::allComplete() const {
  return std::all_of(devices.begin(), devices.end(), [](const DeviceSummary& d) {
    return d.outcome == DeviceOutcome::Complete && d.allTasksComplete();
  });
}
