#pragma once
/** @file  SshConnection.hpp
 *  @brief libssh2 interactive shell + SFTP/SCP file access, optionally tunneled
 *         through a relay host.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

// AmpPoll headers
#include "io/RemoteFileAccess.hpp"
#include "io/ShellChannel.hpp"

namespace amppoll {
  namespace io {

    struct SshEndpoint {
      std::string host;
      int port{ 22 };
      std::string username;
      std::string password; ///< empty = try ssh-agent, then ~/.ssh/id_rsa
    };

    /// Connection set-up failure, tagged with the hop and stage that failed.
    class SshError : public std::runtime_error {
    public:
      enum class Stage { RelayConnect, RelayAuth, Tunnel, TargetConnect, TargetAuth, Shell };

      SshError(Stage stage, const std::string& what) : std::runtime_error(what), stage_{ stage } {}

      Stage stage() const noexcept { return stage_; }

    private:
      Stage stage_;
    };

    /**
 * @class SshConnection
 * @brief Owns every libssh2 handle needed to talk to one device.
 *
 *  * Relay mode: session to the relay, `direct-tcpip` channel to the target,
 *    a socketpair + pump thread so the inner session gets a real fd.
 *  * Shell reads/writes run non-blocking; file operations switch the session
 *    to blocking for their duration.
 *  * `close()` is idempotent; the destructor calls it.
 */
    class SshConnection : public ShellChannel, public RemoteFileAccess {

    public:
      /// Opens the connection and an interactive PTY shell. Throws SshError.
      static std::unique_ptr<SshConnection> connect(const SshEndpoint& target,
                                                    const std::optional<SshEndpoint>& relay,
                                                    std::chrono::milliseconds connectTimeout);

      ~SshConnection() override;

      //---ShellChannel-----------------------------------------
      bool write(const std::string& data) override;
      std::optional<std::string> read(std::chrono::milliseconds maxWait) override;
      void close() override;

      //---RemoteFileAccess-------------------------------------
      std::optional<std::uintmax_t> remoteSize(const std::string& path) override;
      void fetch(const std::string& remotePath, const std::filesystem::path& localPath) override;

    private:
      struct Impl;

      SshConnection();

      std::unique_ptr<Impl> impl_;
    };

  } // namespace io
} // namespace amppoll
