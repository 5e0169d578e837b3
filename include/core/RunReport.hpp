#pragma once
/** @file  RunReport.hpp
 *  @brief Per-task, per-device and per-run outcome records.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// AmpPoll headers
#include "core/Errors.hpp"
#include "core/ProfileStore.hpp"
#include "protocols/ExecutionResult.hpp"

namespace amppoll::core {

  enum class TaskStatus {
    Pending,
    Complete,
    Failed,
    Timeout,
    Aborted,
    Skipped,
    MissingArtifact,
    EmptyArtifact,
    Mismatch ///< steps passed, read-back facts differ from the expected values
  };

  enum class DeviceOutcome { Complete, Failed, Aborted };

  const char* toString(TaskStatus s);
  const char* toString(DeviceOutcome o);

  struct TaskSummary {
    std::string name;
    TaskStatus status{ TaskStatus::Pending };
    std::vector<protocols::ExecutionResult> results{};
    std::vector<std::filesystem::path> artifacts{}; ///< local copies
    std::optional<std::string> detail{};
  };

  struct DeviceSummary {
    std::string deviceKey;
    std::string address;
    DeviceOutcome outcome{ DeviceOutcome::Failed };
    std::optional<std::size_t> failedAtStep{}; ///< 1-based, across all tasks of the device
    std::vector<TaskSummary> tasks{};
    std::optional<std::string> error{};
    std::optional<ConnectError::Kind> connectError{};
    std::optional<PlanError::Kind> planError{};
    std::chrono::milliseconds elapsed{ 0 };
    ProfileState discovered = ProfileState::object();
    std::optional<std::string> persistError{}; ///< results stay valid when set
    std::optional<std::string> haltedBy{};     ///< critical task whose failure skipped the rest

    bool allTasksComplete() const;
  };

  struct RunReport {
    std::vector<DeviceSummary> devices;

    bool allComplete() const;
    int exitCode() const { return allComplete() ? 0 : 1; }
  };

} // namespace amppoll::core
