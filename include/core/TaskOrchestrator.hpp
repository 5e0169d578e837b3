#pragma once
/** @file  TaskOrchestrator.hpp
 *  @brief Plans, connects, executes, verifies, fetches and persists, one
 *         worker thread per device.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// AmpPoll headers
#include "core/CommandPlanner.hpp"
#include "core/DeviceProfile.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ProfileStore.hpp"
#include "core/ProgressObserver.hpp"
#include "core/PromptStateMachine.hpp"
#include "core/RetrievalVerifier.hpp"
#include "core/RunReport.hpp"
#include "core/SessionTransport.hpp"

namespace amppoll::core {

  struct OrchestratorOptions {
    std::filesystem::path outputDir{ "." };
    std::chrono::milliseconds readyTimeout{ 20000 }; ///< login banner -> first prompt
    std::chrono::milliseconds retryBackoff{ 1000 };  ///< multiplied by the attempt number
    EngineOptions engine{};
  };

  /// Everything one device needs for a run.
  struct DeviceJob {
    std::string deviceKey;
    std::string address;
    std::shared_ptr<const DeviceProfile> profile;
    std::vector<std::string> tasks;
    bool viaRelay{ true };
    PlanContext context{}; ///< invocation values; win over state and constants
  };

  /**
 * @class TaskOrchestrator
 * @brief Composes planner, transport, engine, verifier and store per device.
 *
 *  * Steps run strictly in order. A Timeout or Error halts that device only;
 *    its remaining steps are Skipped and `failedAtStep` is recorded.
 *  * After a task's last step, its expectations are compared with the
 *    captured facts (Mismatch on difference); then its artifacts are
 *    verified and fetched.
 *  * A critical task that does not complete skips every later task of that
 *    device and records itself in `haltedBy`.
 *  * Stopped devices (cancel(), deadline) report Aborted. The in-flight step
 *    result is discarded.
 *  * Discovered facts are persisted on every path; sessions are always
 *    closed.
 */
  class TaskOrchestrator {

  public:
    TaskOrchestrator(SessionTransport& transport, ProfileStore& store, std::shared_ptr<ErrorMonitor> errorMonitor,
                     std::shared_ptr<Logger> logger, OrchestratorOptions options = {});

    TaskOrchestrator(const TaskOrchestrator&) = delete;
    TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

    //---public APIs------------------------------------------------------
    void registerObserver(std::shared_ptr<ProgressObserver> observer);

    /// Runs one device on the calling thread.
    DeviceSummary run(const DeviceJob& job, std::stop_token stop = {});

    /// One worker per job; on \p deadline or \p stop every unfinished device
    /// is stopped. Throws std::invalid_argument on duplicate device keys.
    RunReport runAll(const std::vector<DeviceJob>& jobs,
                     std::optional<std::chrono::milliseconds> deadline = std::nullopt, std::stop_token stop = {});

    /// Requests stop for a running device. False if it is not running.
    bool cancel(const std::string& deviceKey);

    /// Context for \p job: profile constants < persisted state < job.context.
    static PlanContext contextFor(const DeviceJob& job, const ProfileState& known);

  private:
    struct Registration; // RAII entry in running_

    void executeTasks(const DeviceJob& job, Session& session, const std::vector<protocols::TaskSequence>& plan,
                      DeviceSummary& summary, std::stop_token stop);
    void retrieveArtifacts(const DeviceJob& job, Session& session, const protocols::TaskSequence& seq,
                           TaskSummary& task);
    /// False (task marked Mismatch) when a captured fact differs from its expectation.
    bool checkExpectations(const DeviceJob& job, const protocols::TaskSequence& seq, const DeviceSummary& summary,
                           TaskSummary& task);
    void applyCaptures(const protocols::CommandStep& step, const std::string& output, DeviceSummary& summary);
    void finish(const DeviceJob& job, DeviceSummary& summary, std::chrono::steady_clock::time_point started);

    std::vector<std::shared_ptr<ProgressObserver>> observers();
    void emitStep(const ProgressEvent& event);
    void emitFinished(const DeviceSummary& summary);
    void note(LogLevel level, const std::string& source, const std::string& message);

    SessionTransport& transport_;
    ProfileStore& store_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::shared_ptr<Logger> logger_;
    OrchestratorOptions options_;
    CommandPlanner planner_;
    RetrievalVerifier verifier_;

    std::mutex observersMtx_;
    std::vector<std::shared_ptr<ProgressObserver>> observers_;
    std::mutex deliveryMtx_; ///< callbacks run one at a time, never under observersMtx_

    std::mutex runningMtx_;
    std::map<std::string, std::stop_source> running_;
  };

} // namespace amppoll::core
