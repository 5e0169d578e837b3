/* @file ProfileStore.cpp
 * @brief per-file locked JSON persistence with durable atomic replace
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

// POSIX
#include <fcntl.h>
#include <unistd.h>

// AmpPoll headers
#include "core/Errors.hpp"
#include "core/ProfileStore.hpp"

using namespace amppoll::core;
namespace fs = std::filesystem;

namespace {

  // device keys come from the command line; one safe path segment, one file per key
  std::string encodeKey(const std::string& key) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size());
    for (std::size_t i = 0; i < key.size(); ++i) {
      const auto b = static_cast<unsigned char>(key[i]);
      const bool safe = (b >= 'a' && b <= 'z') || (b >= 'A' && b <= 'Z') || (b >= '0' && b <= '9') || b == '-' ||
                        b == '_' || (b == '.' && i > 0);
      if (safe) {
        out += static_cast<char>(b);
      } else {
        out += '%';
        out += kHex[b >> 4];
        out += kHex[b & 0x0F];
      }
    }
    return out;
  }

  std::string errnoText(const std::string& what, const fs::path& p) {
    return what + " " + p.string() + ": " + std::strerror(errno);
  }

  void writeAll(int fd, const std::string& contents, const fs::path& p) {
    std::size_t done = 0;
    while (done < contents.size()) {
      const ssize_t n = ::write(fd, contents.data() + done, contents.size() - done);
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0)
        throw std::runtime_error(errnoText("write", p));
      done += static_cast<std::size_t>(n);
    }
  }

  // makes the rename itself durable
  void syncDirectory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
      throw std::runtime_error(errnoText("open", dir));
    const int rc = ::fsync(fd);
    const std::string err = rc != 0 ? errnoText("fsync", dir) : std::string{};
    ::close(fd);
    if (rc != 0)
      throw std::runtime_error(err);
  }

} // namespace

ProfileStore::ProfileStore(fs::path directory, PersistRetryPolicy policy, std::shared_ptr<Logger> logger)
    : dir_(std::move(directory)), policy_(policy), logger_(std::move(logger)) {
  if (policy_.attempts < 1)
    policy_.attempts = 1;
  if (!logger_)
    logger_ = std::make_shared<Logger>(16);
}

fs::path ProfileStore::pathFor(const std::string& deviceKey) const {
  if (deviceKey.empty())
    throw std::invalid_argument("[ProfileStore] empty device key");
  return dir_ / (encodeKey(deviceKey) + ".json");
}

std::shared_ptr<std::mutex> ProfileStore::lockFor(const fs::path& file) {
  std::lock_guard<std::mutex> lock(registryMtx_);
  auto& slot = fileLocks_[file.lexically_normal().string()];
  if (!slot)
    slot = std::make_shared<std::mutex>();
  return slot;
}

ProfileState ProfileStore::read(const std::string& deviceKey) const {
  // lock-free read: rename() makes every observed file a complete one
  return readFile(pathFor(deviceKey));
}

ProfileState ProfileStore::readFile(const fs::path& file) const {
  std::ifstream in(file);
  if (!in)
    return ProfileState::object();

  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find_first_not_of(" \t\r\n") == std::string::npos)
    return ProfileState::object();

  ProfileState state = ProfileState::parse(text, nullptr, false);
  if (state.is_discarded() || !state.is_object()) {
    logger_->log(LogLevel::Warning, "ProfileStore", "ignoring corrupt state file " + file.string());
    return ProfileState::object();
  }
  return state;
}

ProfileState ProfileStore::update(const std::string& deviceKey, const ProfileState& patch) {
  if (!patch.is_object() && !patch.is_null())
    throw std::invalid_argument("[ProfileStore] patch for '" + deviceKey + "' is not an object");

  const fs::path target = pathFor(deviceKey);
  auto fileLock = lockFor(target);
  std::lock_guard<std::mutex> guard(*fileLock);

  ProfileState state = readFile(target);
  mergeInto(state, patch);
  const std::string contents = state.dump(2) + "\n";

  auto backoff = policy_.backoff;
  for (int attempt = 1;; ++attempt) {
    try {
      writeFile(target, contents);
      return state;
    } catch (const std::exception& e) {
      logger_->log(LogLevel::Warning, "ProfileStore",
                   "write " + target.string() + " attempt " + std::to_string(attempt) + "/" +
                       std::to_string(policy_.attempts) + " failed: " + e.what());
      if (attempt >= policy_.attempts)
        throw PersistError("[ProfileStore] could not persist '" + deviceKey + "': " + e.what());
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void ProfileStore::mergeInto(ProfileState& target, const ProfileState& patch) {
  if (!target.is_object())
    target = ProfileState::object();
  if (!patch.is_object())
    return;
  for (auto it = patch.begin(); it != patch.end(); ++it) {
    if (it.value().is_null())
      continue;
    if (it.value().is_object() && target.contains(it.key()) && target[it.key()].is_object())
      mergeInto(target[it.key()], it.value());
    else
      target[it.key()] = it.value();
  }
}

void ProfileStore::writeFile(const fs::path& target, const std::string& contents) {
  const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path{ "." };
  fs::create_directories(dir);
  fs::path tmp = target;
  tmp += ".tmp." + std::to_string(::getpid());

  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
    throw std::runtime_error(errnoText("open", tmp));

  std::error_code ec;
  try {
    writeAll(fd, contents, tmp);
    if (::fsync(fd) != 0)
      throw std::runtime_error(errnoText("fsync", tmp));
  } catch (...) {
    ::close(fd);
    fs::remove(tmp, ec);
    throw;
  }
  if (::close(fd) != 0) {
    const std::string err = errnoText("close", tmp);
    fs::remove(tmp, ec);
    throw std::runtime_error(err);
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    const std::string err = "rename to " + target.string() + " failed: " + ec.message();
    fs::remove(tmp, ec);
    throw std::runtime_error(err);
  }
  syncDirectory(dir);
}
