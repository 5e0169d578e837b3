#pragma once
/** @file  DeviceProfile.hpp
 *  @brief Immutable per-image device description: credentials, prompts,
 *         task templates, timeouts.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

// nlohmann
#include <nlohmann/json_fwd.hpp>

// AmpPoll headers
#include "protocols/CommandStep.hpp"

namespace amppoll::core {

  /// A CommandStep whose text may still hold `{placeholders}`.
  struct StepTemplate {
    protocols::CommandStep step;
    std::string range{}; ///< `A-B(S)[,C-D(S)...]`; non-empty = one step per sub-band
  };

  struct TaskTemplate {
    std::vector<std::string> prerequisites{}; ///< group names, see DeviceProfile::prerequisites
    std::vector<StepTemplate> steps{};
    std::vector<protocols::RetrievalSpec> artifacts{};
    std::map<std::string, std::string> expectations{}; ///< fact key -> expected value, may hold placeholders
    bool critical{ false };
  };

  struct ProfileOverrides {
    std::optional<std::chrono::milliseconds> timeout{}; ///< replaces every step timeout
    std::optional<std::string> username{};
    std::optional<std::string> password{};
  };

  /**
 * @struct DeviceProfile
 * @brief One firmware image's fixed behaviour. Device families differ only
 *        by the data in here.
 *
 *  * Shared between workers as `std::shared_ptr<const DeviceProfile>`.
 *  * `withOverrides()` returns a derived copy; the original is never touched.
 */
  struct DeviceProfile {
    std::string image;
    std::string username;
    std::string password;
    std::string promptMarker;
    std::string lineTerminator{ "\n" };
    std::chrono::milliseconds defaultTimeout{ 20000 };
    std::chrono::milliseconds quietPeriod{ 500 };
    std::map<std::string, std::chrono::milliseconds> taskTimeouts{};
    std::map<std::string, std::vector<StepTemplate>> prerequisites{};
    std::map<std::string, TaskTemplate> tasks{};
    std::map<std::string, double> constants{}; ///< opaque to the core

    std::set<std::string> supportedTasks() const;
    bool supports(const std::string& task) const { return tasks.count(task) != 0; }

    /// Timeout for a step of \p task that carries no explicit timeout.
    std::chrono::milliseconds timeoutFor(const std::string& task) const;

    DeviceProfile withOverrides(const ProfileOverrides& overrides) const;
  };

  struct RelaySettings {
    std::string host;
    int port{ 22 };
    std::string username;
    std::string password{};
  };

  /**
 * @class ProfileCatalog
 * @brief Loaded configuration: profiles keyed by image tag, relay settings
 *        keyed by environment name.
 */
  class ProfileCatalog {
  public:
    /// Throws std::runtime_error on schema errors.
    static ProfileCatalog fromJson(const nlohmann::json& doc);

    /// Throws std::out_of_range if the image is unknown.
    std::shared_ptr<const DeviceProfile> profile(const std::string& image) const;

    /// std::nullopt if the environment has no relay configured.
    std::optional<RelaySettings> relayFor(const std::string& environment) const;

    std::vector<std::string> images() const;

  private:
    std::map<std::string, std::shared_ptr<const DeviceProfile>> profiles_;
    std::map<std::string, RelaySettings> relays_;
  };

} // namespace amppoll::core
