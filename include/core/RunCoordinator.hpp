#pragma once

/** @file  RunCoordinator.hpp
 *  @brief Wires config, identity lookup, transport, store, logger and
 *         orchestrator together for one invocation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

// AmpPoll headers
#include "core/CommandPlanner.hpp"
#include "core/DeviceProfile.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/IdentityResolver.hpp"
#include "core/Logger.hpp"
#include "core/ProfileStore.hpp"
#include "core/RunReport.hpp"
#include "core/SessionTransport.hpp"
#include "core/TaskOrchestrator.hpp"

namespace amppoll::core {

  struct RunOptions {
    std::string configPath;
    std::string image;
    std::string environment;
    std::vector<std::string> tasks;
    std::vector<std::pair<std::string, std::string>> devices; ///< key, address
    std::vector<std::string> lookups;                         ///< hardware ids to resolve
    std::string resolverCommand{};
    bool skipRelay{ false };
    std::optional<std::chrono::milliseconds> timeout{};
    std::filesystem::path outputDir{ "output" };
    std::filesystem::path stateDir{ "state" };
    std::optional<std::chrono::milliseconds> deadline{};
    PlanContext context{};
  };

  /// Configuration / usage problem; the front end maps it to exit code 2.
  class SetupError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /**
 * @class RunCoordinator
 * @brief BOOT -> INIT -> IDLE -> RUNNING -> FINISHED, ERROR on setup failure.
 *
 *  * `initialize()` does everything that can fail before a device is touched
 *    and throws SetupError.
 *  * `handleAbort()` may be called from another thread while `run()` blocks.
 */
  class RunCoordinator {

  public:
    explicit RunCoordinator(RunOptions options, std::shared_ptr<IdentityResolver> resolver = nullptr);
    ~RunCoordinator();

    //---public APIs------------------------------------------------------
    void initialize(); ///< load config, build profile, resolve identities, open run log
    RunReport run();   ///< all devices, blocking
    void handleAbort();

    const std::vector<DeviceJob>& jobs() const { return jobs_; }
    std::shared_ptr<ErrorMonitor> errorMonitor() const { return errorMonitor_; }

  private:
    enum class State { BOOT, INIT, IDLE, RUNNING, FINISHED, ERROR };

    void transitionTo(State next);
    void buildJobs(const std::shared_ptr<const DeviceProfile>& profile);

    RunOptions options_;
    std::shared_ptr<IdentityResolver> resolver_;
    std::atomic<State> currentState_{ State::BOOT };

    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<SessionTransport> transport_;
    std::unique_ptr<ProfileStore> store_;
    std::unique_ptr<TaskOrchestrator> orchestrator_;
    std::vector<DeviceJob> jobs_;
    std::stop_source abort_;
  };

} // namespace amppoll::core
