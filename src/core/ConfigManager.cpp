#include "ConfigManager.h"
#include "Constants.h"
#include "Logger.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace {

// Wrong-typed values fall back to the default instead of throwing
std::string stringOr(const nlohmann::json &section, const char *key,
                     const std::string &fallback) {
  if (!section.contains(key))
    return fallback;
  if (!section[key].is_string()) {
    LOG_W("ConfigManager", "'{}' must be a string, using '{}'", key, fallback);
    return fallback;
  }
  return section[key].get<std::string>();
}

bool boolOr(const nlohmann::json &section, const char *key, bool fallback) {
  if (!section.contains(key))
    return fallback;
  if (!section[key].is_boolean()) {
    LOG_W("ConfigManager", "'{}' must be true or false, using {}", key,
          fallback);
    return fallback;
  }
  return section[key].get<bool>();
}

} // namespace

QueryBackend queryBackendFromString(const std::string &name,
                                    QueryBackend fallback) {
  if (name == "scan")
    return QueryBackend::Scan;
  if (name == "indexed")
    return QueryBackend::Indexed;
  return fallback;
}

bool ConfigManager::init(const std::filesystem::path &dir) {
  if (dir.empty()) {
    LOG_E("ConfigManager", "No config directory given");
    return false;
  }

  configDir_ = dir;

  // Ensure directory exists
  std::error_code ec;
  std::filesystem::create_directories(configDir_, ec);
  if (ec) {
    LOG_E("ConfigManager", "Failed to create dir {}: {}", configDir_.string(),
          ec.message());
    return false;
  }

  configPath_ = configDir_ / HamCall::CONFIG_FILE_NAME;
  return true;
}

bool ConfigManager::load(ResolverConfig &config) const {
  if (configPath_.empty())
    return false;

  std::ifstream ifs(configPath_);
  if (!ifs)
    return false;

  auto json = nlohmann::json::parse(ifs, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    LOG_W("ConfigManager", "Invalid JSON in {}", configPath_.string());
    return false;
  }

  // Engine
  if (json.contains("engine") && json["engine"].is_object()) {
    auto &en = json["engine"];
    std::string backend = stringOr(en, "backend", "indexed");
    config.backend = queryBackendFromString(backend, QueryBackend::Indexed);
    if (backend != queryBackendName(config.backend)) {
      LOG_W("ConfigManager", "Unknown backend '{}', using indexed", backend);
    }
    config.validateWindows = boolOr(en, "validate_windows", true);
  }

  // Logging
  if (json.contains("logging") && json["logging"].is_object()) {
    config.logLevel = stringOr(json["logging"], "level", "warn");
  }

  LOG_I("ConfigManager", "Loaded {}", configPath_.string());
  return true;
}

bool ConfigManager::save(const ResolverConfig &config) const {
  if (configPath_.empty())
    return false;

  std::error_code ec;
  std::filesystem::create_directories(configDir_, ec);
  if (ec) {
    LOG_E("ConfigManager", "Failed to create dir {}: {}", configDir_.string(),
          ec.message());
    return false;
  }

  nlohmann::json json;
  json["engine"]["backend"] = queryBackendName(config.backend);
  json["engine"]["validate_windows"] = config.validateWindows;

  json["logging"]["level"] = config.logLevel;

  std::ofstream ofs(configPath_);
  if (!ofs) {
    LOG_E("ConfigManager", "Cannot write {}", configPath_.string());
    return false;
  }

  ofs << json.dump(2) << "\n";
  return ofs.good();
}
