#pragma once
/** @file  ProfileStore.hpp
 *  @brief Durable per-device fact store (one JSON file per device key).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// nlohmann
#include <nlohmann/json.hpp>

// AmpPoll headers
#include "core/Logger.hpp"

namespace amppoll::core {

  /// key -> last discovered value; always a JSON object.
  using ProfileState = nlohmann::json;

  struct PersistRetryPolicy {
    int attempts{ 3 };
    std::chrono::milliseconds backoff{ 50 }; ///< doubled after every failed attempt
  };

  /**
 * @class ProfileStore
 * @brief Thread-safe read / deep-merge update of ProfileState.
 *
 *  * Device keys map to file names one-to-one: bytes outside
 *    `[A-Za-z0-9_.-]`, `%` and a leading `.` are written as `%XX`.
 *  * Locks are per state file: updates to one key serialize, other keys
 *    never wait on them.
 *  * Writes go to a temp file that is fsync'ed, renamed over the target,
 *    and followed by an fsync of the directory, so a crash leaves either
 *    the old or the new state on disk.
 *  * Null values in a patch are ignored; nothing is ever wholesale replaced.
 */
  class ProfileStore {
  public:
    /// \p logger receives corrupt-file and retry warnings; a private one is
    /// used when null.
    explicit ProfileStore(std::filesystem::path directory, PersistRetryPolicy policy = {},
                          std::shared_ptr<Logger> logger = nullptr);
    virtual ~ProfileStore() = default;

    //---public APIs------------------------------------------------------
    /// Empty object if the key has no file, or the file is empty or corrupt.
    ProfileState read(const std::string& deviceKey) const;

    /// Merges \p patch and persists. Throws PersistError once retries run out.
    ProfileState update(const std::string& deviceKey, const ProfileState& patch);

    std::filesystem::path pathFor(const std::string& deviceKey) const;

    /// Recursive object merge; null patch values are skipped.
    static void mergeInto(ProfileState& target, const ProfileState& patch);

  protected:
    /// Temp file + fsync + rename + directory fsync. Throws std::runtime_error.
    virtual void writeFile(const std::filesystem::path& target, const std::string& contents);

  private:
    std::shared_ptr<std::mutex> lockFor(const std::filesystem::path& file);
    ProfileState readFile(const std::filesystem::path& file) const;

    std::filesystem::path dir_;
    PersistRetryPolicy policy_;
    std::shared_ptr<Logger> logger_;
    std::mutex registryMtx_;
    std::map<std::string, std::shared_ptr<std::mutex>> fileLocks_; ///< keyed by state file path
  };

} // namespace amppoll::core
