/* @file DeviceProfile.cpp
 * @brief JSON -> DeviceProfile / ProfileCatalog, derived-copy overrides
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <regex>
#include <stdexcept>

// nlohmann
#include <nlohmann/json.hpp>

// AmpPoll headers
#include "core/DeviceProfile.hpp"

using namespace amppoll::core;
using amppoll::protocols::CommandStep;
using amppoll::protocols::RetrievalSpec;
using json = nlohmann::json;

namespace {

  std::optional<std::chrono::milliseconds> optMillis(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
      return std::nullopt;
    return std::chrono::milliseconds{ j.at(key).get<long long>() };
  }

  // "validation": "x" and "validation": ["x", "y"] are both accepted
  std::vector<std::string> stringList(const json& j) {
    if (j.is_null())
      return {};
    if (j.is_string())
      return { j.get<std::string>() };
    return j.get<std::vector<std::string>>();
  }

  StepTemplate parseStep(const json& j) {
    StepTemplate t;
    CommandStep& s = t.step;
    s.command = j.at("command").get<std::string>();
    if (j.contains("validation"))
      s.validation = stringList(j.at("validation"));
    s.delayBeforePrompt = optMillis(j, "delayBeforePromptMs");
    s.timeout = optMillis(j, "timeoutMs");
    s.promptMarker = j.value("promptMarker", std::string{});
    s.waitForPrompt = j.value("waitForPrompt", true);
    s.retries = j.value("retries", 0);
    if (j.contains("capture"))
      s.captures = j.at("capture").get<std::map<std::string, std::string>>();
    for (const auto& [key, pattern] : s.captures) {
      try {
        if (std::regex(pattern).mark_count() < 1)
          throw std::runtime_error("capture '" + key + "' has no group");
      } catch (const std::regex_error& e) {
        throw std::runtime_error("capture '" + key + "': " + e.what());
      }
    }
    t.range = j.value("range", std::string{});
    return t;
  }

  std::vector<StepTemplate> parseSteps(const json& arr) {
    std::vector<StepTemplate> out;
    for (const auto& step : arr)
      out.push_back(parseStep(step));
    return out;
  }

  TaskTemplate parseTask(const std::string& name, const json& j) {
    TaskTemplate t;
    if (j.contains("requires"))
      t.prerequisites = stringList(j.at("requires"));
    t.steps = parseSteps(j.at("steps"));
    if (j.contains("artifacts")) {
      for (const auto& a : j.at("artifacts")) {
        RetrievalSpec spec;
        spec.remotePath = a.at("remotePath").get<std::string>();
        spec.minSize = a.value("minSize", std::uintmax_t{ 1 });
        spec.localName = a.value("localName", std::string{});
        spec.task = name;
        t.artifacts.push_back(std::move(spec));
      }
    }
    if (j.contains("expect")) {
      for (const auto& [key, v] : j.at("expect").items())
        t.expectations[key] = v.is_string() ? v.get<std::string>() : v.dump();
    }
    t.critical = j.value("critical", false);
    return t;
  }

  DeviceProfile parseProfile(const std::string& image, const json& j) {
    DeviceProfile p;
    p.image = image;
    p.username = j.value("username", std::string{});
    p.password = j.value("password", std::string{});
    p.promptMarker = j.at("promptMarker").get<std::string>();
    if (p.promptMarker.empty())
      throw std::runtime_error("promptMarker must not be empty");
    p.lineTerminator = j.value("lineTerminator", std::string{ "\n" });
    p.defaultTimeout = optMillis(j, "defaultTimeoutMs").value_or(p.defaultTimeout);
    p.quietPeriod = optMillis(j, "quietPeriodMs").value_or(p.quietPeriod);

    if (j.contains("taskTimeoutsMs"))
      for (const auto& [task, v] : j.at("taskTimeoutsMs").items())
        p.taskTimeouts[task] = std::chrono::milliseconds{ v.get<long long>() };
    if (j.contains("constants"))
      p.constants = j.at("constants").get<std::map<std::string, double>>();
    if (j.contains("prerequisites"))
      for (const auto& [group, steps] : j.at("prerequisites").items())
        p.prerequisites[group] = parseSteps(steps);
    for (const auto& [task, body] : j.at("tasks").items())
      p.tasks[task] = parseTask(task, body);
    return p;
  }

  RelaySettings parseRelay(const json& j) {
    RelaySettings r;
    r.host = j.at("host").get<std::string>();
    r.port = j.value("port", 22);
    r.username = j.value("username", std::string{});
    r.password = j.value("password", std::string{});
    return r;
  }

} // namespace

std::set<std::string> DeviceProfile::supportedTasks() const {
  std::set<std::string> out;
  for (const auto& [name, _] : tasks)
    out.insert(name);
  return out;
}

std::chrono::milliseconds DeviceProfile::timeoutFor(const std::string& task) const {
  auto it = taskTimeouts.find(task);
  return it != taskTimeouts.end() ? it->second : defaultTimeout;
}

DeviceProfile DeviceProfile::withOverrides(const ProfileOverrides& overrides) const {
  DeviceProfile copy = *this;
  if (overrides.username)
    copy.username = *overrides.username;
  if (overrides.password)
    copy.password = *overrides.password;

  if (overrides.timeout) {
    copy.defaultTimeout = *overrides.timeout;
    copy.taskTimeouts.clear();
    for (auto& [_, task] : copy.tasks)
      for (auto& t : task.steps)
        t.step.timeout = *overrides.timeout;
    for (auto& [_, group] : copy.prerequisites)
      for (auto& t : group)
        t.step.timeout = *overrides.timeout;
  }
  return copy;
}

ProfileCatalog ProfileCatalog::fromJson(const json& doc) {
  ProfileCatalog catalog;

  if (!doc.contains("profiles") || !doc.at("profiles").is_object())
    throw std::runtime_error("[ProfileCatalog] config has no \"profiles\" object");

  for (const auto& [image, body] : doc.at("profiles").items()) {
    try {
      catalog.profiles_[image] = std::make_shared<const DeviceProfile>(parseProfile(image, body));
    } catch (const std::exception& e) {
      throw std::runtime_error("[ProfileCatalog] profile '" + image + "': " + e.what());
    }
  }

  if (doc.contains("environments")) {
    for (const auto& [env, body] : doc.at("environments").items()) {
      if (!body.contains("relay") || body.at("relay").is_null())
        continue;
      try {
        catalog.relays_[env] = parseRelay(body.at("relay"));
      } catch (const std::exception& e) {
        throw std::runtime_error("[ProfileCatalog] environment '" + env + "': " + e.what());
      }
    }
  }
  return catalog;
}

std::shared_ptr<const DeviceProfile> ProfileCatalog::profile(const std::string& image) const {
  auto it = profiles_.find(image);
  if (it == profiles_.end())
    throw std::out_of_range("[ProfileCatalog] unknown image: " + image);
  return it->second;
}

std::optional<RelaySettings> ProfileCatalog::relayFor(const std::string& environment) const {
  auto it = relays_.find(environment);
  if (it == relays_.end())
    return std::nullopt;
  return it->second;
}

std::vector<std::string> ProfileCatalog::images() const {
  std::vector<std::string> out;
  for (const auto& [image, _] : profiles_)
    out.push_back(image);
  return out;
}
