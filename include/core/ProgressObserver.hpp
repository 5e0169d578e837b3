#pragma once
/** @file  ProgressObserver.hpp
 *  @brief Plain callback interface for run progress. The core formats nothing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <string>

// AmpPoll headers
#include "core/RunReport.hpp"
#include "protocols/ExecutionResult.hpp"

namespace amppoll::core {

  struct ProgressEvent {
    std::string deviceKey;
    std::string task;
    std::size_t stepIndex{ 0 }; ///< 1-based, across all tasks of the device
    std::string command;
    protocols::ExecutionStatus status{ protocols::ExecutionStatus::Error };
    std::chrono::milliseconds elapsed{ 0 };
    int attempt{ 1 };
  };

  /// Calls are serialized by the orchestrator; implementations need no locking.
  class ProgressObserver {
  public:
    virtual ~ProgressObserver() = default;

    virtual void onStep(const ProgressEvent& event) = 0;
    virtual void onDeviceFinished(const DeviceSummary& summary) = 0;
  };

} // namespace amppoll::core
