/* @file SshConnection.cpp
 * @brief libssh2 plumbing: sockets, relay tunnel pump, PTY shell, SFTP stat and SCP fetch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring> // for strerror, strdup
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// libssh2 headers
#include <libssh2.h>
#include <libssh2_sftp.h>

// AmpPoll headers
#include "io/SshConnection.hpp"

using namespace amppoll::io;

namespace {

  std::once_flag g_libInit;

  void ensureLibraryInit() {
    std::call_once(g_libInit, [] {
      if (libssh2_init(0) != 0)
        throw std::runtime_error("[SshConnection] libssh2_init failed");
    });
  }

  std::string lastError(LIBSSH2_SESSION* s) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(s, &msg, &len, 0);
    return msg ? std::string(msg, static_cast<std::size_t>(len)) : std::string("unknown libssh2 error");
  }

  int waitMs(std::chrono::milliseconds d) {
    return static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, d.count()));
  }

  // Non-blocking connect bounded by timeout; tries every resolved address.
  int openSocket(const std::string& host, int port, std::chrono::milliseconds timeout,
                 std::string& err) {
    std::string name = host;
    if (name.size() > 2 && name.front() == '[' && name.back() == ']')
      name = name.substr(1, name.size() - 2);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (int rc = ::getaddrinfo(name.c_str(), std::to_string(port).c_str(), &hints, &res); rc != 0) {
      err = gai_strerror(rc);
      return -1;
    }

    int fd = -1;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
      fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
      if (fd < 0) {
        err = strerror(errno);
        continue;
      }
      const int flags = ::fcntl(fd, F_GETFL, 0);
      ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

      int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
      if (rc != 0 && errno == EINPROGRESS) {
        pollfd pfd{ fd, POLLOUT, 0 };
        do {
          rc = ::poll(&pfd, 1, waitMs(timeout));
        } while (rc == -1 && errno == EINTR);
        if (rc == 1) {
          int soErr = 0;
          socklen_t len = sizeof(soErr);
          ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len);
          errno = soErr;
          rc = soErr == 0 ? 0 : -1;
        } else {
          if (rc == 0)
            errno = ETIMEDOUT;
          rc = -1;
        }
      }

      if (rc == 0) {
        ::fcntl(fd, F_SETFL, flags);
        break;
      }
      err = strerror(errno);
      ::close(fd);
      fd = -1;
    }
    ::freeaddrinfo(res);
    return fd;
  }

  void kbdintCallback(const char*, int, const char*, int, int numPrompts,
                      const LIBSSH2_USERAUTH_KBDINT_PROMPT*, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                      void** abstract) {
    const auto* password = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < numPrompts; ++i) {
      // libssh2 frees the response text with its default free()
      responses[i].text = ::strdup(password ? password->c_str() : "");
      responses[i].length = static_cast<unsigned int>(password ? password->size() : 0);
    }
  }

  bool authenticate(LIBSSH2_SESSION* s, const SshEndpoint& ep) {
    const char* user = ep.username.c_str();
    const auto userLen = static_cast<unsigned int>(ep.username.size());

    if (!ep.password.empty()) {
      if (libssh2_userauth_password(s, user, ep.password.c_str()) == 0)
        return true;
      const char* methods = libssh2_userauth_list(s, user, userLen);
      if (methods && std::strstr(methods, "keyboard-interactive")) {
        void** abstract = libssh2_session_abstract(s);
        *abstract = const_cast<std::string*>(&ep.password);
        const int rc = libssh2_userauth_keyboard_interactive(s, user, &kbdintCallback);
        *abstract = nullptr;
        return rc == 0;
      }
      return false;
    }

    if (LIBSSH2_AGENT* agent = libssh2_agent_init(s)) {
      bool ok = false;
      if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        libssh2_agent_publickey* identity = nullptr;
        libssh2_agent_publickey* prev = nullptr;
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
          if (libssh2_agent_userauth(agent, user, identity) == 0) {
            ok = true;
            break;
          }
          prev = identity;
        }
        libssh2_agent_disconnect(agent);
      }
      libssh2_agent_free(agent);
      if (ok)
        return true;
    }

    const char* home = std::getenv("HOME");
    if (!home)
      return false;
    const std::string key = std::string(home) + "/.ssh/id_rsa";
    return libssh2_userauth_publickey_fromfile(s, user, nullptr, key.c_str(), nullptr) == 0;
  }

  bool writeAll(int fd, const char* data, std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
      ssize_t n = ::write(fd, data + total, size - total);
      if (n > 0)
        total += static_cast<std::size_t>(n);
      else if (n == -1 && errno == EINTR)
        continue;
      else
        return false;
    }
    return true;
  }

  /// Switches a session to blocking mode for the lifetime of the scope.
  class BlockingScope {
  public:
    explicit BlockingScope(LIBSSH2_SESSION* s) : s_{ s } { libssh2_session_set_blocking(s_, 1); }
    ~BlockingScope() { libssh2_session_set_blocking(s_, 0); }
    BlockingScope(const BlockingScope&) = delete;
    BlockingScope& operator=(const BlockingScope&) = delete;

  private:
    LIBSSH2_SESSION* s_;
  };

} // namespace

struct SshConnection::Impl {
  // relay hop
  int relaySock{ -1 };
  LIBSSH2_SESSION* relay{ nullptr };
  LIBSSH2_CHANNEL* tunnel{ nullptr };
  int pair[2]{ -1, -1 }; ///< [0] pumped by forwarder, [1] handed to the inner session
  std::thread forwarder;
  std::atomic<bool> forwarding{ false };

  // target hop
  int sock{ -1 };
  LIBSSH2_SESSION* session{ nullptr };
  LIBSSH2_CHANNEL* shell{ nullptr };
  LIBSSH2_SFTP* sftp{ nullptr };

  void pump();
  void waitSocket(std::chrono::milliseconds timeout) const;
  void shutdown();
};

// -------------------------------------------------------------------
// Impl::pump
// Shovels bytes between the relay's direct-tcpip channel and pair[0]
// until either side closes or shutdown() clears `forwarding`.
// -------------------------------------------------------------------
void SshConnection::Impl::pump() {
  char buf[16384];
  libssh2_session_set_blocking(relay, 0);

  while (forwarding) {
    pollfd fds[2] = { { relaySock, POLLIN, 0 }, { pair[0], POLLIN, 0 } };
    if (::poll(fds, 2, 50) == -1 && errno != EINTR)
      break;

    // target -> inner session
    for (;;) {
      ssize_t n = libssh2_channel_read(tunnel, buf, sizeof(buf));
      if (n > 0) {
        if (!writeAll(pair[0], buf, static_cast<std::size_t>(n))) {
          forwarding = false;
          break;
        }
        continue;
      }
      if (n < 0 && n != LIBSSH2_ERROR_EAGAIN)
        forwarding = false;
      else if (libssh2_channel_eof(tunnel))
        forwarding = false;
      break;
    }

    // inner session -> target
    if (forwarding && (fds[1].revents & (POLLIN | POLLHUP))) {
      ssize_t n = ::read(pair[0], buf, sizeof(buf));
      if (n == -1 && (errno == EINTR || errno == EAGAIN))
        continue;
      if (n <= 0) {
        forwarding = false;
        break;
      }
      ssize_t off = 0;
      while (off < n && forwarding) {
        ssize_t w = libssh2_channel_write(tunnel, buf + off, static_cast<std::size_t>(n - off));
        if (w == LIBSSH2_ERROR_EAGAIN) {
          pollfd pfd{ relaySock, POLLIN | POLLOUT, 0 };
          ::poll(&pfd, 1, 50);
          continue;
        }
        if (w < 0) {
          forwarding = false;
          break;
        }
        off += w;
      }
    }
  }
  ::shutdown(pair[0], SHUT_RDWR);
}

void SshConnection::Impl::waitSocket(std::chrono::milliseconds timeout) const {
  const int dirs = libssh2_session_block_directions(session);
  short events = 0;
  if (dirs & LIBSSH2_SESSION_BLOCK_INBOUND)
    events |= POLLIN;
  if (dirs & LIBSSH2_SESSION_BLOCK_OUTBOUND)
    events |= POLLOUT;
  pollfd pfd{ sock, events ? events : static_cast<short>(POLLIN), 0 };
  ::poll(&pfd, 1, waitMs(timeout));
}

void SshConnection::Impl::shutdown() {
  if (session)
    libssh2_session_set_blocking(session, 1);
  if (sftp) {
    libssh2_sftp_shutdown(sftp);
    sftp = nullptr;
  }
  if (shell) {
    libssh2_channel_close(shell);
    libssh2_channel_free(shell);
    shell = nullptr;
  }
  if (session) {
    libssh2_session_disconnect(session, "amppoll: closing session");
    libssh2_session_free(session);
    session = nullptr;
  }

  forwarding = false;
  if (forwarder.joinable())
    forwarder.join();
  if (sock >= 0 && sock == pair[1])
    sock = -1; // closed with the pair below
  for (int& fd : pair) {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
  if (tunnel) {
    libssh2_session_set_blocking(relay, 1);
    libssh2_channel_free(tunnel);
    tunnel = nullptr;
  }
  if (relay) {
    libssh2_session_disconnect(relay, "amppoll: closing relay");
    libssh2_session_free(relay);
    relay = nullptr;
  }
  if (relaySock >= 0)
    ::close(relaySock);
  relaySock = -1;

  if (sock >= 0)
    ::close(sock);
  sock = -1;
}

SshConnection::SshConnection() : impl_{ std::make_unique<Impl>() } {}

SshConnection::~SshConnection() { close(); }

std::unique_ptr<SshConnection> SshConnection::connect(const SshEndpoint& target,
                                                      const std::optional<SshEndpoint>& relay,
                                                      std::chrono::milliseconds connectTimeout) {
  ensureLibraryInit();

  std::unique_ptr<SshConnection> conn(new SshConnection());
  Impl& d = *conn->impl_;
  const auto timeoutMs = static_cast<long>(connectTimeout.count());
  std::string err;

  if (relay) {
    d.relaySock = openSocket(relay->host, relay->port, connectTimeout, err);
    if (d.relaySock < 0)
      throw SshError(SshError::Stage::RelayConnect,
                     "[SshConnection] relay " + relay->host + " unreachable: " + err);

    d.relay = libssh2_session_init();
    if (!d.relay)
      throw SshError(SshError::Stage::RelayConnect, "[SshConnection] relay session init failed");
    libssh2_session_set_blocking(d.relay, 1);
    libssh2_session_set_timeout(d.relay, timeoutMs);
    if (libssh2_session_handshake(d.relay, d.relaySock) != 0)
      throw SshError(SshError::Stage::RelayConnect,
                     "[SshConnection] relay handshake failed: " + lastError(d.relay));
    if (!authenticate(d.relay, *relay))
      throw SshError(SshError::Stage::RelayAuth,
                     "[SshConnection] relay rejected user " + relay->username + ": " + lastError(d.relay));

    d.tunnel = libssh2_channel_direct_tcpip(d.relay, target.host.c_str(), target.port);
    if (!d.tunnel)
      throw SshError(SshError::Stage::Tunnel, "[SshConnection] relay cannot reach " + target.host +
                                                  ": " + lastError(d.relay));

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, d.pair) != 0)
      throw SshError(SshError::Stage::Tunnel,
                     std::string("[SshConnection] socketpair failed: ") + strerror(errno));
    d.sock = d.pair[1];
    d.forwarding = true;
    d.forwarder = std::thread([&d] { d.pump(); });
  } else {
    d.sock = openSocket(target.host, target.port, connectTimeout, err);
    if (d.sock < 0)
      throw SshError(SshError::Stage::TargetConnect,
                     "[SshConnection] target " + target.host + " unreachable: " + err);
  }

  d.session = libssh2_session_init();
  if (!d.session)
    throw SshError(SshError::Stage::TargetConnect, "[SshConnection] session init failed");
  libssh2_session_set_blocking(d.session, 1);
  libssh2_session_set_timeout(d.session, timeoutMs);
  if (libssh2_session_handshake(d.session, d.sock) != 0)
    throw SshError(SshError::Stage::TargetConnect,
                   "[SshConnection] handshake with " + target.host + " failed: " + lastError(d.session));
  if (!authenticate(d.session, target))
    throw SshError(SshError::Stage::TargetAuth, "[SshConnection] " + target.host + " rejected user " +
                                                    target.username + ": " + lastError(d.session));

  d.shell = libssh2_channel_open_session(d.session);
  if (!d.shell || libssh2_channel_request_pty(d.shell, "vanilla") != 0 ||
      libssh2_channel_shell(d.shell) != 0)
    throw SshError(SshError::Stage::Shell,
                   "[SshConnection] interactive shell refused: " + lastError(d.session));

  libssh2_session_set_blocking(d.session, 0);
  return conn;
}

bool SshConnection::write(const std::string& data) {
  if (!impl_->shell)
    return false;

  std::size_t total = 0;
  while (total < data.size()) {
    ssize_t n = libssh2_channel_write(impl_->shell, data.data() + total, data.size() - total);
    if (n >= 0) {
      total += static_cast<std::size_t>(n);
    } else if (n == LIBSSH2_ERROR_EAGAIN) {
      impl_->waitSocket(std::chrono::milliseconds{ 100 });
    } else {
      std::cerr << "[SshConnection] write: " << lastError(impl_->session) << '\n';
      return false;
    }
  }
  return true;
}

// -------------------------------------------------------------------
// SshConnection::read
// Returns everything readable right now, or waits up to maxWait for the
// first byte. std::nullopt on EOF or channel error.
// -------------------------------------------------------------------
std::optional<std::string> SshConnection::read(std::chrono::milliseconds maxWait) {
  if (!impl_->shell)
    return std::nullopt;

  const auto deadline = std::chrono::steady_clock::now() + maxWait;
  std::string out;
  char buf[4096];

  for (;;) {
    ssize_t n = libssh2_channel_read(impl_->shell, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
      std::cerr << "[SshConnection] read: " << lastError(impl_->session) << '\n';
      if (!out.empty())
        return out;
      return std::nullopt;
    }

    if (!out.empty())
      return out;
    if (libssh2_channel_eof(impl_->shell))
      return std::nullopt;

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      return out; // timeout, nothing arrived

    pollfd pfd{ impl_->sock, POLLIN, 0 };
    if (::poll(&pfd, 1, waitMs(left)) == -1 && errno != EINTR) {
      std::cerr << "[SshConnection] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
  }
}

void SshConnection::close() { impl_->shutdown(); }

std::optional<std::uintmax_t> SshConnection::remoteSize(const std::string& path) {
  if (!impl_->session)
    throw TransferError("[SshConnection] stat on closed connection: " + path);

  BlockingScope blocking(impl_->session);
  if (!impl_->sftp) {
    impl_->sftp = libssh2_sftp_init(impl_->session);
    if (!impl_->sftp)
      throw TransferError("[SshConnection] sftp subsystem unavailable: " + lastError(impl_->session));
  }

  LIBSSH2_SFTP_ATTRIBUTES attrs{};
  const int rc = libssh2_sftp_stat(impl_->sftp, path.c_str(), &attrs);
  if (rc == 0)
    return (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ? attrs.filesize : 0;

  if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
    const unsigned long code = libssh2_sftp_last_error(impl_->sftp);
    if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH)
      return std::nullopt;
  }
  throw TransferError("[SshConnection] stat " + path + " failed: " + lastError(impl_->session));
}

void SshConnection::fetch(const std::string& remotePath, const std::filesystem::path& localPath) {
  if (!impl_->session)
    throw TransferError("[SshConnection] fetch on closed connection: " + remotePath);

  BlockingScope blocking(impl_->session);
  libssh2_struct_stat info{};
  LIBSSH2_CHANNEL* ch = libssh2_scp_recv2(impl_->session, remotePath.c_str(), &info);
  if (!ch)
    throw TransferError("[SshConnection] scp " + remotePath + ": " + lastError(impl_->session));

  std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    libssh2_channel_free(ch);
    throw TransferError("[SshConnection] cannot write " + localPath.string());
  }

  char buf[16384];
  libssh2_struct_stat_size got = 0;
  while (got < info.st_size) {
    const auto want = std::min<libssh2_struct_stat_size>(sizeof(buf), info.st_size - got);
    ssize_t n = libssh2_channel_read(ch, buf, static_cast<std::size_t>(want));
    if (n > 0) {
      out.write(buf, n);
      got += n;
    } else if (n == 0 && libssh2_channel_eof(ch)) {
      break;
    } else if (n < 0) {
      break;
    }
  }
  libssh2_channel_free(ch);

  if (got < info.st_size || !out.flush())
    throw TransferError("[SshConnection] short transfer for " + remotePath);
}
