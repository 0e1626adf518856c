#pragma once

#include "Callsign.h"
#include "PrefixResolver.h"

#include <string>
#include <variant>
#include <vector>

enum class PartType { Prefix, Other };

struct CallsignPart {
  std::string part;
  PartType type = PartType::Other;
};

// Accepted callsign layouts
enum class CallsignShape {
  SinglePrefix, // the call is one bare prefix, e.g. "RW0A"
  OnePrefix,    // one prefix then appendices, e.g. "W1AW/P"
  TwoPrefixes   // two prefixes then appendices, e.g. "F/W1AW/P"
};

using ShapeResult = std::variant<CallsignShape, CallsignError>;

class CallsignSegmenter {
public:
  explicit CallsignSegmenter(const ReferenceQuery &query) : resolver_(query) {}

  // Split on '/' and tag every part. A part is a prefix if it resolves on its
  // own, except reserved appendices (AM, MM, SAT, P, M, QRP, LH) which are
  // always Other after the first position.
  std::vector<CallsignPart> segment(const std::string &call,
                                    const Timestamp &t) const;

  // Validate the sequence of part types.
  static ShapeResult classify(const std::vector<CallsignPart> &parts);

  static bool isReservedAppendix(const std::string &part);

private:
  PrefixResolver resolver_;
};
