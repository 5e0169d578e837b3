#pragma once
/** @file  SessionTransport.hpp
 *  @brief Opens and closes the one interactive session each device gets.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

// AmpPoll headers
#include "core/Clock.hpp"
#include "core/DeviceProfile.hpp"
#include "core/ErrorMonitor.hpp"
#include "io/RemoteFileAccess.hpp"
#include "io/ShellChannel.hpp"

namespace amppoll::core {

  /**
 * @struct Session
 * @brief Live handle on one device shell. Owned by exactly one worker.
 */
  struct Session {
    std::string address;
    std::shared_ptr<const DeviceProfile> profile;
    std::shared_ptr<io::ShellChannel> shell;
    std::shared_ptr<io::RemoteFileAccess> files;
    std::shared_ptr<const Clock> clock;
    bool open{ false };
    Clock::time_point lastActivity{};

    bool isOpen() const { return open && shell != nullptr; }
  };

  struct TransportOptions {
    std::chrono::milliseconds connectTimeout{ 10000 };
    int sshPort{ 22 };
  };

  /**
 * @class SessionTransport
 * @brief Turns (profile, address) into a Session, refusing a second open
 *        session for the same address.
 *
 *  * `openLink()` is the seam: the default builds an io::SshConnection,
 *    tests override it with scripted channels.
 *  * Connect failures are mapped to ConnectError kinds and reported to the
 *    ErrorMonitor before being rethrown.
 */
  class SessionTransport {
  public:
    struct Link {
      std::shared_ptr<io::ShellChannel> shell;
      std::shared_ptr<io::RemoteFileAccess> files;
      std::shared_ptr<const Clock> clock;
    };

    SessionTransport(std::optional<RelaySettings> relay, std::shared_ptr<ErrorMonitor> errorMonitor,
                     TransportOptions options = {});
    virtual ~SessionTransport() = default;

    //---public APIs------------------------------------------------------
    /// Throws ConnectError, or std::logic_error if \p address already has a session.
    Session open(std::shared_ptr<const DeviceProfile> profile, const std::string& address,
                 bool viaRelay);

    /// Idempotent; safe after errors and on never-opened sessions.
    void close(Session& session);

    bool hasOpenSession(const std::string& address) const;

  protected:
    virtual Link openLink(const DeviceProfile& profile, const std::string& address, bool viaRelay);

    std::optional<RelaySettings> relay_;
    TransportOptions options_;

  private:
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    mutable std::mutex mtx_;
    std::set<std::string> openAddresses_;
  };

} // namespace amppoll::core
