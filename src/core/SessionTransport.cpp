/* @file SessionTransport.cpp
 * @brief one-session-per-device bookkeeping + SshError -> ConnectError mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <stdexcept>

// AmpPoll headers
#include "core/Errors.hpp"
#include "core/SessionTransport.hpp"
#include "io/SshConnection.hpp"

using namespace amppoll::core;

SessionTransport::SessionTransport(std::optional<RelaySettings> relay,
                                   std::shared_ptr<ErrorMonitor> errorMonitor, TransportOptions options)
    : relay_(std::move(relay)), options_(options), errorMonitor_(std::move(errorMonitor)) {
  assert(errorMonitor_ && "[SessionTransport] error monitor is nullptr");
}

Session SessionTransport::open(std::shared_ptr<const DeviceProfile> profile, const std::string& address,
                               bool viaRelay) {
  if (!profile)
    throw std::invalid_argument("[SessionTransport] open without a profile");

  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!openAddresses_.insert(address).second)
      throw std::logic_error("[SessionTransport] " + address + " already has an open session");
  }

  auto release = [this, &address] {
    std::lock_guard<std::mutex> lock(mtx_);
    openAddresses_.erase(address);
  };

  Link link;
  try {
    if (viaRelay && !relay_)
      throw ConnectError(ConnectError::Kind::RelayUnreachable, ConnectError::Hop::Relay,
                         "[SessionTransport] no relay configured for this environment");
    link = openLink(*profile, address, viaRelay);
  } catch (const ConnectError& e) {
    release();
    errorMonitor_->notifyFailure(std::string(e.what()));
    throw;
  } catch (...) {
    release();
    throw;
  }

  Session session;
  session.address = address;
  session.profile = std::move(profile);
  session.shell = std::move(link.shell);
  session.files = std::move(link.files);
  session.clock = link.clock ? std::move(link.clock) : std::make_shared<SteadyClock>();
  session.open = true;
  session.lastActivity = session.clock->now();
  return session;
}

void SessionTransport::close(Session& session) {
  if (!session.open)
    return;
  session.open = false;
  if (session.shell)
    session.shell->close();

  std::lock_guard<std::mutex> lock(mtx_);
  openAddresses_.erase(session.address);
}

bool SessionTransport::hasOpenSession(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return openAddresses_.count(address) != 0;
}

SessionTransport::Link SessionTransport::openLink(const DeviceProfile& profile, const std::string& address,
                                                  bool viaRelay) {
  using Stage = io::SshError::Stage;

  io::SshEndpoint target{ address, options_.sshPort, profile.username, profile.password };
  std::optional<io::SshEndpoint> hop;
  if (viaRelay)
    hop = io::SshEndpoint{ relay_->host, relay_->port, relay_->username, relay_->password };

  try {
    std::shared_ptr<io::SshConnection> conn = io::SshConnection::connect(target, hop, options_.connectTimeout);
    return Link{ conn, conn, std::make_shared<SteadyClock>() };
  } catch (const io::SshError& e) {
    switch (e.stage()) {
    case Stage::RelayConnect:
      throw ConnectError(ConnectError::Kind::RelayUnreachable, ConnectError::Hop::Relay, e.what());
    case Stage::RelayAuth:
      throw ConnectError(ConnectError::Kind::AuthRejected, ConnectError::Hop::Relay, e.what());
    case Stage::TargetAuth:
      throw ConnectError(ConnectError::Kind::AuthRejected, ConnectError::Hop::Target, e.what());
    case Stage::Tunnel:
    case Stage::TargetConnect:
    case Stage::Shell:
    default:
      throw ConnectError(ConnectError::Kind::TargetUnreachable, ConnectError::Hop::Target, e.what());
    }
  }
}
