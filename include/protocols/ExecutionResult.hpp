#pragma once
/** @file  ExecutionResult.hpp
 *  @brief Typed outcome of one executed CommandStep.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <optional>
#include <string>

namespace amppoll {
  namespace protocols {

    enum class ExecutionStatus { Complete, Timeout, Error, Cancelled };

    inline const char* toString(ExecutionStatus s) {
      switch (s) {
      case ExecutionStatus::Complete:
        return "Complete";
      case ExecutionStatus::Timeout:
        return "Timeout";
      case ExecutionStatus::Error:
        return "Error";
      case ExecutionStatus::Cancelled:
        return "Cancelled";
      default:
        return "Unknown";
      }
    }

    struct ExecutionResult {
      std::string command;
      ExecutionStatus status{ ExecutionStatus::Error };
      std::string output{}; ///< normalized text, partial on Timeout
      std::chrono::milliseconds elapsed{ 0 };
      std::optional<std::string> error{};

      bool ok() const { return status == ExecutionStatus::Complete; }
    };

  } // namespace protocols
} // namespace amppoll
