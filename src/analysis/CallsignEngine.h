#pragma once

#include "../core/ConfigManager.h"
#include "../core/ReferenceData.h"
#include "../core/ReferenceQuery.h"
#include "CallsignAnalyzer.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// Entry point for callers holding a loaded ReferenceTable: picks the query
// backend from the config and wires the analyzer to it.
// The table must outlive the engine.
class CallsignEngine {
public:
  CallsignEngine(const ReferenceTable &table, const ResolverConfig &config);

  // Reads <configDir>/hamcall.json (defaults if missing), applies its log
  // level and builds the engine.
  static std::unique_ptr<CallsignEngine>
  fromConfigDir(const ReferenceTable &table,
                const std::filesystem::path &configDir);

  AnalyzeResult analyze(const std::string &call, const Timestamp &t) const {
    return analyzer_.analyze(call, t);
  }

  bool isAllowed(const std::string &call, int adif, const Timestamp &t) const {
    return analyzer_.isAllowed(call, adif, t);
  }

  const ReferenceQuery &query() const { return *query_; }
  const CallsignAnalyzer &analyzer() const { return analyzer_; }
  const ResolverConfig &config() const { return config_; }

  // Empty unless validateWindows was set
  const std::vector<WindowOverlap> &windowOverlaps() const { return overlaps_; }

private:
  ResolverConfig config_;
  std::unique_ptr<ReferenceQuery> query_;
  CallsignAnalyzer analyzer_;
  std::vector<WindowOverlap> overlaps_;
};
