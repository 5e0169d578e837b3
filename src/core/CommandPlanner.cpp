/* @file CommandPlanner.cpp
 * @brief template + context -> ordered TaskSequences; range and placeholder expansion
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>

// AmpPoll headers
#include "core/CommandPlanner.hpp"
#include "core/Errors.hpp"

using namespace amppoll::core;
using amppoll::protocols::CommandStep;
using amppoll::protocols::TaskSequence;

namespace {

  double multiplier(const std::string& suffix) {
    if (suffix.empty())
      return 1.0;
    switch (std::toupper(static_cast<unsigned char>(suffix.front()))) {
    case 'K':
      return 1e3;
    case 'M':
      return 1e6;
    case 'G':
      return 1e9;
    default:
      return 1.0;
    }
  }

  // far above any RF plan; keeps every sum below in int64 range
  constexpr double kMaxHz = 1e15;

  std::int64_t toHz(const std::string& number, const std::string& suffix, const std::string& segment) {
    double hz = 0.0;
    try {
      hz = std::stod(number) * multiplier(suffix);
    } catch (const std::exception&) {
      throw PlanError(PlanError::Kind::InvalidRange,
                      "[CommandPlanner] unreadable number '" + number + "' in '" + segment + "'");
    }
    if (!std::isfinite(hz) || hz > kMaxHz)
      throw PlanError(PlanError::Kind::InvalidRange,
                      "[CommandPlanner] value " + number + suffix + " out of range in '" + segment + "'");
    return static_cast<std::int64_t>(std::llround(hz));
  }

  bool isPlaceholderName(const std::string& name) {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name.front())) || name.front() == '_'))
      return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
      return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
  }

} // namespace

std::vector<SubBand> amppoll::core::expandRange(const std::string& expression) {
  static const std::regex kSegment(R"(^\s*([0-9]+(?:\.[0-9]+)?)([KkMmGg]?)\s*-\s*([0-9]+(?:\.[0-9]+)?)([KkMmGg]?)\s*\(\s*([0-9]+(?:\.[0-9]+)?)([KkMmGg]?)\s*\)\s*$)");

  std::vector<SubBand> bands;
  std::size_t begin = 0;
  while (begin <= expression.size()) {
    std::size_t comma = expression.find(',', begin);
    if (comma == std::string::npos)
      comma = expression.size();
    const std::string segment = expression.substr(begin, comma - begin);
    begin = comma + 1;

    std::smatch m;
    if (!std::regex_match(segment, m, kSegment))
      throw PlanError(PlanError::Kind::InvalidRange, "[CommandPlanner] malformed range '" + segment + "'");

    const std::int64_t a = toHz(m[1], m[2], segment);
    const std::int64_t b = toHz(m[3], m[4], segment);
    const std::int64_t s = toHz(m[5], m[6], segment);
    if (s <= 0)
      throw PlanError(PlanError::Kind::InvalidRange, "[CommandPlanner] non-positive step in '" + segment + "'");
    if (a >= b)
      throw PlanError(PlanError::Kind::InvalidRange, "[CommandPlanner] empty range '" + segment + "'");

    const std::int64_t count = (b - a) / s + ((b - a) % s != 0 ? 1 : 0);
    if (count > static_cast<std::int64_t>(kMaxSubBands - bands.size()))
      throw PlanError(PlanError::Kind::InvalidRange, "[CommandPlanner] '" + expression + "' expands to more than " +
                                                         std::to_string(kMaxSubBands) + " sub-bands");
    for (std::int64_t i = 0; i < count; ++i) {
      const std::int64_t start = a + i * s;
      bands.push_back({ start, std::min(start + s, b) });
    }
  }
  return bands;
}

std::string amppoll::core::substitute(const std::string& text, const PlanContext& context) {
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('{', pos);
    if (open == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    out.append(text, pos, open - pos);

    const std::size_t close = text.find('}', open + 1);
    const std::string name =
        close == std::string::npos ? std::string{} : text.substr(open + 1, close - open - 1);
    if (!isPlaceholderName(name)) {
      out += '{';
      pos = open + 1;
      continue;
    }

    auto it = context.find(name);
    if (it == context.end())
      throw PlanError(PlanError::Kind::MissingParameter,
                      "[CommandPlanner] no value for {" + name + "} in '" + text + "'");
    out += it->second;
    pos = close + 1;
  }
  return out;
}

void CommandPlanner::appendSteps(std::vector<CommandStep>& out, const std::vector<StepTemplate>& steps,
                                 const PlanContext& context,
                                 std::chrono::milliseconds defaultTimeout) const {
  auto expand = [&](const StepTemplate& t, const PlanContext& ctx) {
    CommandStep step = t.step;
    step.command = substitute(t.step.command, ctx);
    for (auto& v : step.validation)
      v = substitute(v, ctx);
    if (!step.timeout)
      step.timeout = defaultTimeout;
    out.push_back(std::move(step));
  };

  for (const auto& t : steps) {
    if (t.range.empty()) {
      expand(t, context);
      continue;
    }

    const auto bands = expandRange(substitute(t.range, context));
    for (std::size_t i = 0; i < bands.size(); ++i) {
      PlanContext ctx = context;
      ctx["start"] = std::to_string(bands[i].start);
      ctx["stop"] = std::to_string(bands[i].stop);
      ctx["width"] = std::to_string(bands[i].stop - bands[i].start);
      ctx["index"] = std::to_string(i);
      expand(t, ctx);
    }
  }
}

std::vector<TaskSequence> CommandPlanner::generate(const DeviceProfile& profile,
                                                   const std::vector<std::string>& selectedTasks,
                                                   const PlanContext& context) const {
  // validate everything first so a bad name late in the list still fails fast
  for (const auto& name : selectedTasks) {
    if (!profile.supports(name))
      throw PlanError(PlanError::Kind::InvalidTask,
                      "[CommandPlanner] task '" + name + "' not supported by image " + profile.image);
    for (const auto& group : profile.tasks.at(name).prerequisites)
      if (profile.prerequisites.count(group) == 0)
        throw PlanError(PlanError::Kind::InvalidTask,
                        "[CommandPlanner] task '" + name + "' requires unknown group '" + group + "'");
  }

  std::vector<TaskSequence> plan;
  std::set<std::string> inserted;

  for (const auto& name : selectedTasks) {
    const TaskTemplate& task = profile.tasks.at(name);
    const auto timeout = profile.timeoutFor(name);

    TaskSequence seq;
    seq.name = name;
    for (const auto& group : task.prerequisites) {
      if (!inserted.insert(group).second)
        continue;
      appendSteps(seq.steps, profile.prerequisites.at(group), context, timeout);
    }
    appendSteps(seq.steps, task.steps, context, timeout);

    for (auto spec : task.artifacts) {
      spec.remotePath = substitute(spec.remotePath, context);
      spec.localName = substitute(spec.localName, context);
      seq.artifacts.push_back(std::move(spec));
    }
    for (const auto& [key, expected] : task.expectations)
      seq.expectations[key] = substitute(expected, context);
    seq.critical = task.critical;
    plan.push_back(std::move(seq));
  }
  return plan;
}
