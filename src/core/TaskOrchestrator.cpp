/* @file TaskOrchestrator.cpp
 * @brief per-device run loop, worker threads, deadline/cancel plumbing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

// AmpPoll headers
#include "core/TaskOrchestrator.hpp"

using namespace amppoll::core;
using amppoll::protocols::CommandStep;
using amppoll::protocols::ExecutionResult;
using amppoll::protocols::ExecutionStatus;
using amppoll::protocols::TaskSequence;
using std::chrono::milliseconds;

namespace {

  void markPending(DeviceSummary& summary, TaskStatus status) {
    for (auto& task : summary.tasks)
      if (task.status == TaskStatus::Pending)
        task.status = status;
  }

  std::string formatConstant(double v) {
    std::ostringstream os;
    os << std::setprecision(15) << v;
    return os.str();
  }

  // "12.5" -> 12.5, "-3" -> -3, anything else stays text
  ProfileState factValue(const std::string& text) {
    if (text.empty())
      return text;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(v))
      return text;
    if (v == std::floor(v) && std::fabs(v) < 9.0e15)
      return static_cast<std::int64_t>(v);
    return v;
  }

  std::string factText(const ProfileState& v) { return v.is_string() ? v.get<std::string>() : v.dump(); }

  bool parseNumber(const std::string& text, double& out) {
    if (text.empty())
      return false;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size() && std::isfinite(out);
  }

  // numeric when both sides are numbers, else case-insensitive text
  bool sameValue(const std::string& expected, const std::string& found) {
    double e = 0.0;
    double f = 0.0;
    if (parseNumber(expected, e) && parseNumber(found, f))
      return std::fabs(e - f) <= 1e-9 * std::max({ 1.0, std::fabs(e), std::fabs(f) });
    return expected.size() == found.size() &&
           std::equal(expected.begin(), expected.end(), found.begin(), [](unsigned char a, unsigned char b) {
             return std::tolower(a) == std::tolower(b);
           });
  }

} // namespace

// RAII: a device is cancellable exactly while run() is on the stack
struct TaskOrchestrator::Registration {
  Registration(TaskOrchestrator& owner, std::string key) : owner_(owner), key_(std::move(key)) {
    std::lock_guard<std::mutex> lock(owner_.runningMtx_);
    if (!owner_.running_.emplace(key_, source).second)
      throw std::logic_error("[TaskOrchestrator] device '" + key_ + "' is already running");
  }
  ~Registration() {
    std::lock_guard<std::mutex> lock(owner_.runningMtx_);
    owner_.running_.erase(key_);
  }

  std::stop_source source;

private:
  TaskOrchestrator& owner_;
  std::string key_;
};

TaskOrchestrator::TaskOrchestrator(SessionTransport& transport, ProfileStore& store,
                                   std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                                   OrchestratorOptions options)
    : transport_(transport), store_(store), errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)),
      options_(std::move(options)) {
  if (!errorMonitor_)
    errorMonitor_ = std::make_shared<ErrorMonitor>();
}

void TaskOrchestrator::registerObserver(std::shared_ptr<ProgressObserver> observer) {
  if (!observer)
    return;
  std::lock_guard<std::mutex> lock(observersMtx_);
  observers_.push_back(std::move(observer));
}

bool TaskOrchestrator::cancel(const std::string& deviceKey) {
  std::lock_guard<std::mutex> lock(runningMtx_);
  auto it = running_.find(deviceKey);
  if (it == running_.end())
    return false;
  return it->second.request_stop() || it->second.stop_requested();
}

PlanContext TaskOrchestrator::contextFor(const DeviceJob& job, const ProfileState& known) {
  PlanContext ctx;
  if (job.profile)
    for (const auto& [name, value] : job.profile->constants)
      ctx[name] = formatConstant(value);

  if (known.is_object()) {
    for (auto it = known.begin(); it != known.end(); ++it) {
      const auto& v = it.value();
      if (v.is_string())
        ctx[it.key()] = v.get<std::string>();
      else if (v.is_number() || v.is_boolean())
        ctx[it.key()] = v.dump();
    }
  }

  ctx["device"] = job.deviceKey;
  for (const auto& [name, value] : job.context)
    ctx[name] = value;
  return ctx;
}

DeviceSummary TaskOrchestrator::run(const DeviceJob& job, std::stop_token stop) {
  const auto started = std::chrono::steady_clock::now();

  DeviceSummary summary;
  summary.deviceKey = job.deviceKey;
  summary.address = job.address;
  for (const auto& name : job.tasks) {
    TaskSummary task;
    task.name = name;
    summary.tasks.push_back(std::move(task));
  }

  Registration registration(*this, job.deviceKey);
  std::stop_callback forward(stop, [&registration] { registration.source.request_stop(); });
  const std::stop_token token = registration.source.get_token();

  if (!job.profile) {
    summary.error = "[TaskOrchestrator] no profile for " + job.deviceKey;
    markPending(summary, TaskStatus::Skipped);
    finish(job, summary, started);
    return summary;
  }

  std::vector<TaskSequence> plan;
  try {
    plan = planner_.generate(*job.profile, job.tasks, contextFor(job, store_.read(job.deviceKey)));
  } catch (const PlanError& e) {
    summary.planError = e.kind();
    summary.error = e.what();
  } catch (const std::exception& e) {
    summary.error = std::string("[TaskOrchestrator] cannot plan ") + job.deviceKey + ": " + e.what();
  }
  if (summary.error) {
    markPending(summary, TaskStatus::Skipped);
    finish(job, summary, started);
    return summary;
  }

  if (token.stop_requested()) {
    summary.outcome = DeviceOutcome::Aborted;
    markPending(summary, TaskStatus::Aborted);
    finish(job, summary, started);
    return summary;
  }

  note(LogLevel::Info, job.deviceKey, "connecting to " + job.address + (job.viaRelay ? " via relay" : ""));
  Session session;
  try {
    session = transport_.open(job.profile, job.address, job.viaRelay);
  } catch (const ConnectError& e) {
    summary.connectError = e.kind();
    summary.error = e.what();
  } catch (const std::logic_error& e) {
    summary.error = e.what();
  }

  if (!summary.error) {
    try {
      executeTasks(job, session, plan, summary, token);
    } catch (const std::exception& e) {
      summary.error = std::string("[TaskOrchestrator] ") + e.what();
      markPending(summary, TaskStatus::Skipped);
    }
    transport_.close(session);
  } else {
    markPending(summary, TaskStatus::Skipped);
  }

  finish(job, summary, started);
  return summary;
}

void TaskOrchestrator::executeTasks(const DeviceJob& job, Session& session, const std::vector<TaskSequence>& plan,
                                    DeviceSummary& summary, std::stop_token stop) {
  PromptStateMachine engine(options_.engine);

  const ExecutionResult ready = engine.awaitReady(session, options_.readyTimeout, stop);
  if (ready.status == ExecutionStatus::Cancelled) {
    summary.outcome = DeviceOutcome::Aborted;
    markPending(summary, TaskStatus::Aborted);
    return;
  }
  if (!ready.ok()) {
    summary.error = "[TaskOrchestrator] shell on " + job.address +
                    " never showed a prompt: " + ready.error.value_or(protocols::toString(ready.status));
    markPending(summary, TaskStatus::Skipped);
    return;
  }

  std::size_t stepIndex = 0;
  for (std::size_t t = 0; t < plan.size(); ++t) {
    const TaskSequence& seq = plan[t];
    TaskSummary& task = summary.tasks[t];
    note(LogLevel::Info, job.deviceKey, "task " + seq.name + ": " + std::to_string(seq.steps.size()) + " steps");

    for (const CommandStep& step : seq.steps) {
      ++stepIndex;
      ExecutionResult result;
      for (int attempt = 1;; ++attempt) {
        result = engine.execute(session, step, stop);

        ProgressEvent event;
        event.deviceKey = job.deviceKey;
        event.task = seq.name;
        event.stepIndex = stepIndex;
        event.command = step.command;
        event.status = result.status;
        event.elapsed = result.elapsed;
        event.attempt = attempt;
        emitStep(event);

        if (result.status != ExecutionStatus::Timeout || attempt > step.retries)
          break;

        note(LogLevel::Warning, job.deviceKey,
             "'" + step.command + "' timed out, retry " + std::to_string(attempt) + "/" +
                 std::to_string(step.retries));
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(m);
        cv.wait_for(lock, stop, options_.retryBackoff * attempt, [] { return false; });
        if (stop.stop_requested())
          break;
      }

      if (result.status == ExecutionStatus::Cancelled || stop.stop_requested()) {
        // in-flight result is dropped
        summary.outcome = DeviceOutcome::Aborted;
        markPending(summary, TaskStatus::Aborted);
        note(LogLevel::Warning, job.deviceKey, "stopped at step " + std::to_string(stepIndex));
        return;
      }

      task.results.push_back(result);
      if (!result.ok()) {
        summary.failedAtStep = stepIndex;
        task.status = result.status == ExecutionStatus::Timeout ? TaskStatus::Timeout : TaskStatus::Failed;
        task.detail = result.error;
        summary.error = "[TaskOrchestrator] step " + std::to_string(stepIndex) + " '" + step.command +
                        "': " + result.error.value_or(protocols::toString(result.status));
        if (seq.critical)
          summary.haltedBy = seq.name;
        markPending(summary, TaskStatus::Skipped);
        return;
      }
      applyCaptures(step, result.output, summary);
    }

    if (checkExpectations(job, seq, summary, task))
      retrieveArtifacts(job, session, seq, task);

    if (seq.critical && task.status != TaskStatus::Complete) {
      summary.haltedBy = seq.name;
      summary.error = "[TaskOrchestrator] critical task '" + seq.name + "' ended " + toString(task.status) +
                      (task.detail ? ": " + *task.detail : std::string{});
      note(LogLevel::Critical, job.deviceKey, "stopping after " + seq.name + ", remaining tasks skipped");
      markPending(summary, TaskStatus::Skipped);
      return;
    }
  }
}

bool TaskOrchestrator::checkExpectations(const DeviceJob& job, const TaskSequence& seq, const DeviceSummary& summary,
                                         TaskSummary& task) {
  std::string mismatches;
  for (const auto& [key, expected] : seq.expectations) {
    const std::string found = summary.discovered.contains(key) ? factText(summary.discovered.at(key)) : "not found";
    if (summary.discovered.contains(key) && sameValue(expected, found))
      continue;
    if (!mismatches.empty())
      mismatches += "; ";
    mismatches += key + ": expected " + expected + ", found " + found;
  }
  if (mismatches.empty())
    return true;

  task.status = TaskStatus::Mismatch;
  task.detail = mismatches;
  note(LogLevel::Error, job.deviceKey, seq.name + " read-back mismatch: " + mismatches);
  return false;
}

void TaskOrchestrator::retrieveArtifacts(const DeviceJob& job, Session& session, const TaskSequence& seq,
                                         TaskSummary& task) {
  if (seq.artifacts.empty()) {
    task.status = TaskStatus::Complete;
    return;
  }
  if (!session.files) {
    task.status = TaskStatus::Failed;
    task.detail = "no file access on this session";
    return;
  }

  try {
    const VerifyOutcome outcome = verifier_.verify(*session.files, seq.artifacts);
    if (!outcome.ok()) {
      task.status = outcome.status == VerifyStatus::MissingArtifact ? TaskStatus::MissingArtifact
                                                                    : TaskStatus::EmptyArtifact;
      task.detail = outcome.path;
      note(LogLevel::Warning, job.deviceKey, std::string(toString(outcome.status)) + ": " + outcome.path);
      return;
    }

    std::filesystem::create_directories(options_.outputDir);
    for (const auto& spec : seq.artifacts) {
      const std::string name = spec.localName.empty()
                                   ? std::filesystem::path(spec.remotePath).filename().string()
                                   : spec.localName;
      const auto local = options_.outputDir / (job.deviceKey + "_" + name);
      session.files->fetch(spec.remotePath, local);
      task.artifacts.push_back(local);
      note(LogLevel::Info, job.deviceKey, "fetched " + spec.remotePath + " -> " + local.string());
    }
    task.status = TaskStatus::Complete;
  } catch (const io::TransferError& e) {
    task.status = TaskStatus::Failed;
    task.detail = e.what();
  } catch (const std::filesystem::filesystem_error& e) {
    task.status = TaskStatus::Failed;
    task.detail = e.what();
  }
}

void TaskOrchestrator::applyCaptures(const CommandStep& step, const std::string& output, DeviceSummary& summary) {
  for (const auto& [key, pattern] : step.captures) {
    const std::regex re(pattern);
    std::smatch m;
    if (std::regex_search(output, m, re) && m.size() > 1 && m[1].matched)
      summary.discovered[key] = factValue(m[1].str());
  }
}

void TaskOrchestrator::finish(const DeviceJob& job, DeviceSummary& summary,
                              std::chrono::steady_clock::time_point started) {
  if (!summary.discovered.empty()) {
    try {
      store_.update(job.deviceKey, summary.discovered);
    } catch (const std::exception& e) {
      summary.persistError = e.what();
      note(LogLevel::Error, job.deviceKey, e.what());
      errorMonitor_->notifyFailure(e.what());
    }
  }

  if (summary.outcome != DeviceOutcome::Aborted)
    summary.outcome = !summary.error && summary.allTasksComplete() ? DeviceOutcome::Complete : DeviceOutcome::Failed;

  summary.elapsed = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

  if (summary.outcome == DeviceOutcome::Failed) {
    const std::string why = summary.error.value_or("not every task completed");
    note(LogLevel::Error, job.deviceKey, why);
    errorMonitor_->notifyFailure(job.deviceKey + ": " + why);
  } else {
    note(LogLevel::Info, job.deviceKey, std::string("finished: ") + toString(summary.outcome));
  }
  emitFinished(summary);
}

RunReport TaskOrchestrator::runAll(const std::vector<DeviceJob>& jobs, std::optional<milliseconds> deadline,
                                   std::stop_token stop) {
  std::set<std::string> keys;
  for (const auto& job : jobs)
    if (!keys.insert(job.deviceKey).second)
      throw std::invalid_argument("[TaskOrchestrator] duplicate device key '" + job.deviceKey + "'");

  RunReport report;
  report.devices.resize(jobs.size());
  std::vector<std::stop_source> sources(jobs.size());
  std::stop_callback stopAll(stop, [&sources] {
    for (auto& source : sources)
      source.request_stop();
  });

  std::mutex doneMtx;
  std::condition_variable doneCv;
  std::size_t done = 0;

  std::vector<std::thread> workers;
  workers.reserve(jobs.size());
  for (std::size_t i = 0; i < jobs.size(); ++i) {
    workers.emplace_back([this, &jobs, &report, &sources, &doneMtx, &doneCv, &done, i] {
      DeviceSummary summary;
      try {
        summary = run(jobs[i], sources[i].get_token());
      } catch (const std::exception& e) {
        summary = DeviceSummary{};
        summary.deviceKey = jobs[i].deviceKey;
        summary.address = jobs[i].address;
        summary.error = e.what();
        for (const auto& name : jobs[i].tasks) {
          TaskSummary task;
          task.name = name;
          task.status = TaskStatus::Skipped;
          summary.tasks.push_back(std::move(task));
        }
        errorMonitor_->notifyFailure(e.what());
      }
      report.devices[i] = std::move(summary);
      {
        std::lock_guard<std::mutex> lock(doneMtx);
        ++done;
      }
      doneCv.notify_all();
    });
  }

  if (deadline) {
    std::unique_lock<std::mutex> lock(doneMtx);
    if (!doneCv.wait_for(lock, *deadline, [&] { return done == jobs.size(); })) {
      note(LogLevel::Warning, "TaskOrchestrator", "deadline reached, stopping unfinished devices");
      for (auto& source : sources)
        source.request_stop();
    }
  }

  for (auto& worker : workers)
    worker.join();
  return report;
}

std::vector<std::shared_ptr<ProgressObserver>> TaskOrchestrator::observers() {
  std::lock_guard<std::mutex> lock(observersMtx_);
  return observers_;
}

void TaskOrchestrator::emitStep(const ProgressEvent& event) {
  const auto targets = observers();
  std::lock_guard<std::mutex> lock(deliveryMtx_);
  for (const auto& observer : targets)
    observer->onStep(event);
}

void TaskOrchestrator::emitFinished(const DeviceSummary& summary) {
  const auto targets = observers();
  std::lock_guard<std::mutex> lock(deliveryMtx_);
  for (const auto& observer : targets)
    observer->onDeviceFinished(summary);
}

void TaskOrchestrator::note(LogLevel level, const std::string& source, const std::string& message) {
  if (logger_)
    logger_->log(level, source, message);
}
