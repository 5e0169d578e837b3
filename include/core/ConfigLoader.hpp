#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Finds and reads the amppoll JSON configuration.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace amppoll::core {

  /**
 * @class ConfigLoader
 * @brief Reads one JSON document (comments allowed) whose root must be an
 *        object. Interpreting it is ProfileCatalog's job.
 */
  class ConfigLoader {
  public:
    explicit ConfigLoader(std::filesystem::path configPath);

    /// Throws std::runtime_error("[ConfigLoader] ...") on I/O or parse errors.
    nlohmann::json load() const;

    const std::filesystem::path& path() const { return path_; }

    /// First existing file of: $AMPPOLL_CONFIG, ./config/amppoll.json,
    /// /etc/amppoll/amppoll.json.
    static std::optional<std::filesystem::path> locate();

  private:
    std::filesystem::path path_;
  };

} // namespace amppoll::core
