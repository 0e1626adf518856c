#include "CallsignEngine.h"
#include "../core/Logger.h"
#include "../core/StringUtils.h"

CallsignEngine::CallsignEngine(const ReferenceTable &table,
                               const ResolverConfig &config)
    : config_(config), query_(makeReferenceQuery(table, config.backend)),
      analyzer_(*query_) {
  LOG_I("Engine",
        "Using {} backend: {} entities, {} prefixes, {} exceptions, {} invalid "
        "operations, {} zone exceptions",
        queryBackendName(config_.backend), table.entities.size(),
        table.prefixes.size(), table.exceptions.size(),
        table.invalidOperations.size(), table.zoneExceptions.size());
  if (table.date) {
    LOG_I("Engine", "Reference data dated {}", StringUtils::formatUtc(*table.date));
  }

  if (config_.validateWindows) {
    overlaps_ = findWindowOverlaps(table);
    for (const auto &o : overlaps_) {
      LOG_W("Engine",
            "Overlapping validity windows for {} '{}': records {} and {}, "
            "lookups use record {}",
            recordKindName(o.kind), o.key, o.firstRecord, o.secondRecord,
            o.firstRecord);
    }
  }
}

std::unique_ptr<CallsignEngine>
CallsignEngine::fromConfigDir(const ReferenceTable &table,
                              const std::filesystem::path &configDir) {
  ResolverConfig config;
  ConfigManager cfgMgr;
  if (!cfgMgr.init(configDir)) {
    LOG_W("Engine", "Config directory unusable, using defaults");
  } else if (!cfgMgr.load(config)) {
    LOG_I("Engine", "No valid config at {}, using defaults",
          cfgMgr.configPath().string());
  }

  if (!Log::setLevelByName(config.logLevel)) {
    LOG_W("Engine", "Unknown log level '{}', using warn", config.logLevel);
  }

  return std::make_unique<CallsignEngine>(table, config);
}
