#pragma once
/** @file  CommandPlanner.hpp
 *  @brief Expands a profile's task templates into the ordered steps sent to
 *         one device.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// AmpPoll headers
#include "core/DeviceProfile.hpp"
#include "protocols/CommandStep.hpp"

namespace amppoll::core {

  /// Placeholder values: `{name}` -> value.
  using PlanContext = std::map<std::string, std::string>;

  /// Half-open [start, stop) in Hz.
  struct SubBand {
    std::int64_t start;
    std::int64_t stop;
  };

  /// Upper bound on the sub-bands one range expression may produce.
  constexpr std::size_t kMaxSubBands = 100000;

  /**
   * @brief Expands `A-B(S)` (K/M/G suffixes, comma-separated list allowed)
   *        into ceil((B-A)/S) contiguous sub-bands covering [A,B).
   * @throws PlanError{InvalidRange} on malformed input, A >= B, S <= 0, a
   *         value above 1 PHz or more than kMaxSubBands sub-bands.
   */
  std::vector<SubBand> expandRange(const std::string& expression);

  /**
   * @brief Replaces every `{name}` with its context value. Braces that do not
   *        wrap an identifier are copied verbatim.
   * @throws PlanError{MissingParameter}
   */
  std::string substitute(const std::string& text, const PlanContext& context);

  /**
 * @class CommandPlanner
 * @brief Stateless; pure function of (profile, tasks, context).
 *
 *  * Runs before any connection is opened, so every PlanError surfaces
 *    without side effects.
 *  * A prerequisite group shared by several tasks is emitted once, at the
 *    front of the first task that requires it.
 */
  class CommandPlanner {
  public:
    std::vector<protocols::TaskSequence> generate(const DeviceProfile& profile,
                                                  const std::vector<std::string>& selectedTasks,
                                                  const PlanContext& context) const;

  private:
    void appendSteps(std::vector<protocols::CommandStep>& out, const std::vector<StepTemplate>& steps,
                     const PlanContext& context, std::chrono::milliseconds defaultTimeout) const;
  };

} // namespace amppoll::core
