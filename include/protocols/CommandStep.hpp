#pragma once
/** @file  CommandStep.hpp
 *  @brief One shell command plus the rules that decide when it has finished.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace amppoll {
  namespace protocols {

    /**
 * @struct CommandStep
 * @brief A fully-expanded step, ready to be written to a device shell.
 *
 *  * `validation` is an any-of list; empty means the step is not validated.
 *  * `promptMarker` empty means "use the profile's marker".
 *  * `captures` and `retries` are read by the orchestrator, not the engine.
 */
    struct CommandStep {
      std::string command;
      std::vector<std::string> validation{};
      std::optional<std::chrono::milliseconds> delayBeforePrompt{};
      std::optional<std::chrono::milliseconds> timeout{};
      std::string promptMarker{};
      bool waitForPrompt{ true };

      std::map<std::string, std::string> captures{}; ///< fact key -> regex with one group
      int retries{ 0 };                              ///< re-sends allowed after Timeout

      std::string toWire(const std::string& terminator = "\n") const { return command + terminator; }
    };

    /** A file a task leaves behind on the device, fetched once the task completes. */
    struct RetrievalSpec {
      std::string remotePath;
      std::uintmax_t minSize{ 1 };
      std::string task{};
      std::string localName{}; ///< empty = basename of remotePath
    };

    /** Ordered steps of one named task. */
    struct TaskSequence {
      std::string name;
      std::vector<CommandStep> steps{};
      std::vector<RetrievalSpec> artifacts{};
      std::map<std::string, std::string> expectations{}; ///< checked against facts captured by the steps
      bool critical{ false };                            ///< failure stops the device's remaining tasks
    };

  } // namespace protocols
} // namespace amppoll
