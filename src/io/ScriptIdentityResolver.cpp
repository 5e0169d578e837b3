/* @file ScriptIdentityResolver.cpp
 * @brief popen() lookup command + JSON/plain output parsing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <vector>

// POSIX
#include <sys/wait.h>

// nlohmann
#include <nlohmann/json.hpp>

// AmpPoll headers
#include "io/ScriptIdentityResolver.hpp"

using namespace amppoll::io;
using amppoll::core::DeviceIdentity;
using amppoll::core::IdentityError;
using json = nlohmann::json;

namespace {

  constexpr std::size_t kMaxOutput = 1 << 20;

  bool safeIdentifier(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
      return std::isxdigit(c) || c == ':' || c == '.' || c == '-';
    });
  }

  std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
      return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }

  std::string firstString(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys)
      if (obj.contains(key) && obj.at(key).is_string() && !obj.at(key).get<std::string>().empty())
        return obj.at(key).get<std::string>();
    return {};
  }

  DeviceIdentity fromObject(const std::string& hardwareId, const json& obj) {
    DeviceIdentity id;
    id.address = firstString(obj, { "address", "ipv6", "ip", "cpeIpv6Addr" });
    id.nodeIdentity = firstString(obj, { "node", "nodeName", "node_name" });
    id.displayName = firstString(obj, { "displayName", "name", "hostname" });
    if (id.displayName.empty())
      id.displayName = hardwareId;
    return id;
  }

} // namespace

ScriptIdentityResolver::ScriptIdentityResolver(std::string command) : command_(std::move(command)) {}

DeviceIdentity ScriptIdentityResolver::resolve(const std::string& hardwareId) {
  if (!safeIdentifier(hardwareId))
    throw IdentityError(IdentityError::Kind::LookupFailed,
                        "[ScriptIdentityResolver] refusing identifier '" + hardwareId + "'");

  std::string cmd = command_;
  const auto slot = cmd.find("{hwid}");
  if (slot != std::string::npos)
    cmd.replace(slot, 6, hardwareId);
  else
    cmd += " " + hardwareId;
  cmd += " 2>/dev/null";

  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (!pipe)
    throw IdentityError(IdentityError::Kind::LookupFailed, "[ScriptIdentityResolver] cannot run '" + cmd + "'");

  // read to EOF so the child never blocks on a full pipe; bytes past the cap are discarded
  std::string output;
  bool oversized = false;
  char buf[4096];
  std::size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
    if (output.size() + n > kMaxOutput)
      oversized = true;
    else
      output.append(buf, n);
  }
  const bool readFailed = std::ferror(pipe) != 0;
  const int status = ::pclose(pipe);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
    throw IdentityError(IdentityError::Kind::LookupFailed,
                        "[ScriptIdentityResolver] lookup for " + hardwareId + " exited abnormally");
  if (readFailed)
    throw IdentityError(IdentityError::Kind::LookupFailed,
                        "[ScriptIdentityResolver] reading lookup output for " + hardwareId + " failed");
  if (oversized)
    throw IdentityError(IdentityError::Kind::LookupFailed, "[ScriptIdentityResolver] lookup output for " +
                                                               hardwareId + " exceeds " +
                                                               std::to_string(kMaxOutput) + " bytes");

  return parseResolverOutput(hardwareId, output);
}

DeviceIdentity ScriptIdentityResolver::parseResolverOutput(const std::string& hardwareId,
                                                           const std::string& output) {
  const std::string text = trim(output);
  if (text.empty())
    throw IdentityError(IdentityError::Kind::NotFound, "[ScriptIdentityResolver] no result for " + hardwareId);

  const json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    // plain single-address output
    if (text.find_first_of(" \t\r\n") != std::string::npos)
      throw IdentityError(IdentityError::Kind::LookupFailed,
                          "[ScriptIdentityResolver] unreadable output for " + hardwareId);
    return DeviceIdentity{ text, {}, hardwareId };
  }

  std::vector<DeviceIdentity> hits;
  if (doc.is_object()) {
    hits.push_back(fromObject(hardwareId, doc));
  } else if (doc.is_array()) {
    for (const auto& entry : doc)
      if (entry.is_object())
        hits.push_back(fromObject(hardwareId, entry));
  } else {
    throw IdentityError(IdentityError::Kind::LookupFailed,
                        "[ScriptIdentityResolver] unexpected JSON for " + hardwareId);
  }

  hits.erase(std::remove_if(hits.begin(), hits.end(), [](const DeviceIdentity& d) { return d.address.empty(); }),
             hits.end());
  if (hits.empty())
    throw IdentityError(IdentityError::Kind::NotFound, "[ScriptIdentityResolver] no address for " + hardwareId);

  std::set<std::string> distinct;
  for (const auto& h : hits)
    distinct.insert(h.address);
  if (distinct.size() > 1)
    throw IdentityError(IdentityError::Kind::Ambiguous, "[ScriptIdentityResolver] " + hardwareId + " maps to " +
                                                            std::to_string(distinct.size()) + " addresses");
  return hits.front();
}
