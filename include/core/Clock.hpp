#pragma once
/** @file  Clock.hpp
 *  @brief Time source for everything that waits on a device.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>

namespace amppoll::core {

  /// Injected so tests can run a 20 s prompt timeout in simulated time.
  class Clock {
  public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
  };

  class SteadyClock : public Clock {
  public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
  };

} // namespace amppoll::core
