#pragma once
/** @file  IdentityResolver.hpp
 *  @brief Hardware identifier (e.g. cable-modem MAC) -> reachable address.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace amppoll::core {

  struct DeviceIdentity {
    std::string address;      ///< IPv4/IPv6 literal or host name
    std::string nodeIdentity; ///< plant node the device hangs off, may be empty
    std::string displayName;
  };

  class IdentityError : public std::runtime_error {
  public:
    enum class Kind { NotFound, Ambiguous, LookupFailed };

    IdentityError(Kind kind, const std::string& what) : std::runtime_error(what), kind_{ kind } {}
    Kind kind() const noexcept { return kind_; }

  private:
    Kind kind_;
  };

  inline const char* toString(IdentityError::Kind k) {
    switch (k) {
    case IdentityError::Kind::NotFound:
      return "NotFound";
    case IdentityError::Kind::Ambiguous:
      return "Ambiguous";
    case IdentityError::Kind::LookupFailed:
      return "LookupFailed";
    default:
      return "Unknown";
    }
  }

  /// Input adapter; only the front end calls it, before a run starts.
  class IdentityResolver {
  public:
    virtual ~IdentityResolver() = default;

    /// Throws IdentityError.
    virtual DeviceIdentity resolve(const std::string& hardwareId) = 0;
  };

} // namespace amppoll::core
