#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Collects connect and device failures from all workers and escalates
 *         each distinct one.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace amppoll::core {

  /**
 * @class ErrorMonitor
 * @brief Shared by SessionTransport, TaskOrchestrator and ProfileStore users.
 *
 * * A message reaches the escalation sinks the first time it is seen; repeats
 *   only bump the report count.
 * * Sinks run outside the lock and may call back into the monitor.
 * * `notifyFailure()` is virtual so tests can mock it.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const std::string&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Adds a sink; sinks are called in registration order.
    void registerEscalation(Escalation sink);

    virtual void notifyFailure(const std::string& message);

    /// Distinct failures in arrival order.
    std::vector<std::string> failures() const;

    /// Every notifyFailure() call, duplicates included.
    std::size_t reportCount() const;

  private:
    void forwardIfNew(const std::string& message);

    std::vector<Escalation> sinks_;
    std::vector<std::string> seen_;
    std::size_t reports_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace amppoll::core
