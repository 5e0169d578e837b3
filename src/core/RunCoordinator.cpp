/* @file RunCoordinator.cpp
 * @brief invocation-level state machine
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <set>

// nlohmann
#include <nlohmann/json.hpp>

// AmpPoll headers
#include "core/ConfigLoader.hpp"
#include "core/LoggingObserver.hpp"
#include "core/RunCoordinator.hpp"
#include "io/ScriptIdentityResolver.hpp"

using namespace amppoll::core;

RunCoordinator::RunCoordinator(RunOptions options, std::shared_ptr<IdentityResolver> resolver)
    : options_(std::move(options)), resolver_(std::move(resolver)),
      errorMonitor_(std::make_shared<ErrorMonitor>()), logger_(std::make_shared<Logger>()) {}

RunCoordinator::~RunCoordinator() { logger_->finishRun(); }

void RunCoordinator::transitionTo(State next) { currentState_ = next; }

void RunCoordinator::initialize() {
  transitionTo(State::INIT);
  try {
    if (options_.tasks.empty())
      throw SetupError("[RunCoordinator] no tasks selected");
    if (options_.devices.empty() && options_.lookups.empty())
      throw SetupError("[RunCoordinator] no devices given");

    ProfileCatalog catalog = ProfileCatalog::fromJson(ConfigLoader(options_.configPath).load());

    std::shared_ptr<const DeviceProfile> profile;
    try {
      profile = catalog.profile(options_.image);
    } catch (const std::out_of_range& e) {
      throw SetupError(e.what());
    }
    if (options_.timeout) {
      ProfileOverrides overrides;
      overrides.timeout = options_.timeout;
      profile = std::make_shared<const DeviceProfile>(profile->withOverrides(overrides));
    }
    for (const auto& task : options_.tasks)
      if (!profile->supports(task))
        throw SetupError("[RunCoordinator] image " + options_.image + " has no task '" + task + "'");

    std::optional<RelaySettings> relay = catalog.relayFor(options_.environment);
    if (!options_.skipRelay && !relay)
      throw SetupError("[RunCoordinator] environment '" + options_.environment + "' has no relay; use --skip-relay");

    if (!options_.lookups.empty() && !resolver_) {
      if (options_.resolverCommand.empty())
        throw SetupError("[RunCoordinator] --lookup needs --resolver");
      resolver_ = std::make_shared<io::ScriptIdentityResolver>(options_.resolverCommand);
    }

    logger_->startNewRun(options_.outputDir);
    buildJobs(profile);

    errorMonitor_->registerEscalation(
        [logger = logger_](const std::string& msg) { logger->log(LogLevel::Critical, "ErrorMonitor", msg); });

    transport_ = std::make_unique<SessionTransport>(relay, errorMonitor_);
    store_ = std::make_unique<ProfileStore>(options_.stateDir, PersistRetryPolicy{}, logger_);

    OrchestratorOptions orchestration;
    orchestration.outputDir = options_.outputDir;
    orchestrator_ = std::make_unique<TaskOrchestrator>(*transport_, *store_, errorMonitor_, logger_, orchestration);
    orchestrator_->registerObserver(std::make_shared<LoggingObserver>(logger_));
  } catch (const SetupError&) {
    transitionTo(State::ERROR);
    throw;
  } catch (const std::runtime_error& e) {
    // ConfigLoader / ProfileCatalog / Logger failures are setup problems too
    transitionTo(State::ERROR);
    throw SetupError(e.what());
  }
  transitionTo(State::IDLE);
}

void RunCoordinator::buildJobs(const std::shared_ptr<const DeviceProfile>& profile) {
  jobs_.clear();
  std::set<std::string> keys;
  auto add = [&](const std::string& key, const std::string& address) {
    if (!keys.insert(key).second)
      throw SetupError("[RunCoordinator] device '" + key + "' given twice");
    DeviceJob job;
    job.deviceKey = key;
    job.address = address;
    job.profile = profile;
    job.tasks = options_.tasks;
    job.viaRelay = !options_.skipRelay;
    job.context = options_.context;
    jobs_.push_back(std::move(job));
  };

  for (const auto& [key, address] : options_.devices)
    add(key, address);

  for (const auto& hwId : options_.lookups) {
    try {
      const DeviceIdentity id = resolver_->resolve(hwId);
      logger_->log(LogLevel::Info, hwId, "resolved to " + id.address +
                                             (id.nodeIdentity.empty() ? "" : " (node " + id.nodeIdentity + ")"));
      add(hwId, id.address);
    } catch (const IdentityError& e) {
      throw SetupError(std::string(e.what()) + " [" + toString(e.kind()) + "]");
    }
  }
}

RunReport RunCoordinator::run() {
  if (currentState_ != State::IDLE)
    throw std::logic_error("[RunCoordinator] run() before a successful initialize()");

  transitionTo(State::RUNNING);
  // an abort that arrived before run() stops every device before it connects
  RunReport report = orchestrator_->runAll(jobs_, options_.deadline, abort_.get_token());
  transitionTo(State::FINISHED);
  logger_->finishRun();
  return report;
}

void RunCoordinator::handleAbort() { abort_.request_stop(); }
