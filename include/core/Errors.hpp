#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by planner, transport and store.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace amppoll::core {

  /// Raised at plan time, before any connection is opened.
  class PlanError : public std::runtime_error {
  public:
    enum class Kind { InvalidTask, InvalidRange, MissingParameter };

    PlanError(Kind kind, const std::string& what) : std::runtime_error(what), kind_{ kind } {}
    Kind kind() const noexcept { return kind_; }

  private:
    Kind kind_;
  };

  /// Raised by SessionTransport::open; nothing has been sent to the device.
  class ConnectError : public std::runtime_error {
  public:
    enum class Kind { RelayUnreachable, TargetUnreachable, AuthRejected };
    enum class Hop { Relay, Target };

    ConnectError(Kind kind, Hop hop, const std::string& what)
        : std::runtime_error(what), kind_{ kind }, hop_{ hop } {}
    Kind kind() const noexcept { return kind_; }
    Hop hop() const noexcept { return hop_; }

  private:
    Kind kind_;
    Hop hop_;
  };

  /// Local storage fault after the bounded retries ran out.
  class PersistError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  inline const char* toString(PlanError::Kind k) {
    switch (k) {
    case PlanError::Kind::InvalidTask:
      return "InvalidTask";
    case PlanError::Kind::InvalidRange:
      return "InvalidRange";
    case PlanError::Kind::MissingParameter:
      return "MissingParameter";
    default:
      return "Unknown";
    }
  }

  inline const char* toString(ConnectError::Kind k) {
    switch (k) {
    case ConnectError::Kind::RelayUnreachable:
      return "RelayUnreachable";
    case ConnectError::Kind::TargetUnreachable:
      return "TargetUnreachable";
    case ConnectError::Kind::AuthRejected:
      return "AuthRejected";
    default:
      return "Unknown";
    }
  }

} // namespace amppoll::core
