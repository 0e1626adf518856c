#pragma once

#include "../core/ReferenceQuery.h"

#include <optional>
#include <string>
#include <vector>

struct PrefixMatch {
  const Prefix *prefix = nullptr;
  // Characters cut from the end of the candidate before it matched.
  // Fewer removed means a more specific match.
  size_t removed = 0;
};

// Longest-match search of a callsign part against the prefix records.
class PrefixResolver {
public:
  explicit PrefixResolver(const ReferenceQuery &query) : query_(query) {}

  // Tries the whole candidate, then shortens it one character at a time from
  // the right down to a single character, and returns the first hit.
  // For every length, compound prefixes "<shortened>/<X>" are tried first for
  // each single-letter X found in appendices, so SV1ABC/A matches SV/A before
  // SV. Other appendices are ignored.
  std::optional<PrefixMatch>
  resolve(const std::string &candidate, const Timestamp &t,
          const std::vector<std::string> &appendices = {}) const;

private:
  const ReferenceQuery &query_;
};
