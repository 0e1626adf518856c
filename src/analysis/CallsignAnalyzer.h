#pragma once

#include "Callsign.h"
#include "CallsignSegmenter.h"
#include "PrefixResolver.h"
#include "WhitelistChecker.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

using AnalyzeResult = std::variant<Callsign, CallsignError>;

// Resolves a callsign to its entity, CQ zone, continent and location at a
// point in time.
//
// Precedence, highest first:
//   format check, invalid operation, callsign exception, segmentation,
//   then per shape: special appendix (/AM, /MM, /SAT), maritime mobile prefix,
//   single digit appendix, plain prefix. CQ zone exceptions are applied last
//   to prefix based results.
//
// Pure function of (call, t) and the reference data: no state is kept between
// calls, so one analyzer can serve several threads.
class CallsignAnalyzer {
public:
  explicit CallsignAnalyzer(const ReferenceQuery &query);

  AnalyzeResult analyze(const std::string &call, const Timestamp &t) const;

  // See WhitelistChecker::isAllowed.
  bool isAllowed(const std::string &call, int adif, const Timestamp &t) const;

  const PrefixResolver &resolver() const { return resolver_; }
  const CallsignSegmenter &segmenter() const { return segmenter_; }

  // Shape check only: A-Z, 0-9 and inner '/', at least two characters, no
  // empty part.
  static bool hasValidFormat(const std::string &call);

private:
  struct OnePrefixInput {
    const std::string &call;
    const Timestamp &t;
    const std::string &homecall;
    const std::vector<std::string> &appendices;
    const PrefixMatch &homecallMatch;
  };

  // A stage either settles the result or passes (nullopt) to the next one.
  using Stage = std::optional<AnalyzeResult> (CallsignAnalyzer::*)(
      const OnePrefixInput &) const;

  AnalyzeResult analyzeSinglePrefix(const std::string &call,
                                    const Timestamp &t) const;
  AnalyzeResult analyzeOnePrefix(const std::string &call, const Timestamp &t,
                                 const std::vector<CallsignPart> &parts) const;
  AnalyzeResult analyzeTwoPrefixes(const std::string &call, const Timestamp &t,
                                   const std::vector<CallsignPart> &parts) const;

  std::optional<AnalyzeResult> specialAppendixStage(const OnePrefixInput &in) const;
  std::optional<AnalyzeResult> maritimePrefixStage(const OnePrefixInput &in) const;
  std::optional<AnalyzeResult> singleDigitStage(const OnePrefixInput &in) const;

  Callsign withZoneException(Callsign callsign, const Timestamp &t) const;

  const ReferenceQuery &query_;
  PrefixResolver resolver_;
  CallsignSegmenter segmenter_;
  WhitelistChecker whitelist_;
};
