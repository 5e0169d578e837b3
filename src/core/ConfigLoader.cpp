/* @file ConfigLoader.cpp
 * @brief config discovery + file -> nlohmann::json
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

// nlohmann
#include <nlohmann/json.hpp>

// AmpPoll headers
#include "core/ConfigLoader.hpp"

using namespace amppoll::core;
namespace fs = std::filesystem;

ConfigLoader::ConfigLoader(fs::path configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_.string());

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in, nullptr, true, true); // allow comments
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_.string() + ": " + e.what());
  }
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] " + path_.string() + ": top level must be an object");
  return doc;
}

std::optional<fs::path> ConfigLoader::locate() {
  std::vector<fs::path> candidates;
  if (const char* env = std::getenv("AMPPOLL_CONFIG"); env && *env)
    candidates.emplace_back(env);
  candidates.emplace_back("config/amppoll.json");
  candidates.emplace_back("/etc/amppoll/amppoll.json");

  for (const auto& p : candidates) {
    std::error_code ec;
    if (fs::is_regular_file(p, ec))
      return p;
  }
  return std::nullopt;
}
