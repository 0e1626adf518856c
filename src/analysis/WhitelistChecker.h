#pragma once

#include "../core/ReferenceQuery.h"

#include <string>

// Post-analysis check for entities that only accept approved callsigns.
// Does not validate the callsign itself, run CallsignAnalyzer first.
class WhitelistChecker {
public:
  explicit WhitelistChecker(const ReferenceQuery &query) : query_(query) {}

  // Returns false only if the entity resolved for call is whitelisted at t,
  // the whitelist period is active, and no callsign exception approves call
  // for exactly that entity.
  bool isAllowed(const std::string &call, int adif, const Timestamp &t) const;

private:
  const ReferenceQuery &query_;
};
