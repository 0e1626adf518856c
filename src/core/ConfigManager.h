#pragma once

#include "ReferenceQuery.h"

#include <filesystem>
#include <string>

struct ResolverConfig {
  // Engine
  QueryBackend backend = QueryBackend::Indexed;
  bool validateWindows = true; // warn about overlapping validity windows

  // Logging
  std::string logLevel = "warn";
};

QueryBackend queryBackendFromString(const std::string &name,
                                    QueryBackend fallback);

class ConfigManager {
public:
  // Resolves the config file path inside dir.
  // Returns false if dir is empty or could not be created.
  bool init(const std::filesystem::path &dir);

  // Load config from disk. Returns false if file is missing or invalid.
  bool load(ResolverConfig &config) const;

  // Save config to disk. Creates directories if needed. Returns false on
  // failure.
  bool save(const ResolverConfig &config) const;

  // Returns the resolved config file path (valid after init()).
  const std::filesystem::path &configPath() const { return configPath_; }
  const std::filesystem::path &configDir() const { return configDir_; }

private:
  std::filesystem::path configDir_;
  std::filesystem::path configPath_;
};
