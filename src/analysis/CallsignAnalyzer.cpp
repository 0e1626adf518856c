#include "CallsignAnalyzer.h"
#include "../core/Constants.h"
#include "../core/Logger.h"
#include "../core/StringUtils.h"

#include <array>

const char *describe(CallsignError error) {
  switch (error) {
  case CallsignError::BasicFormat:
    return "Callsign is of invalid format or includes invalid characters";
  case CallsignError::InvalidOperation:
    return "Callsign was used in an invalid operation";
  case CallsignError::BeginWithoutPrefix:
    return "Callsign does not begin with a valid prefix";
  case CallsignError::ThirdPrefix:
    return "Unexpected third prefix";
  case CallsignError::MultipleSingleDigitAppendices:
    return "Multiple single digit appendices";
  case CallsignError::MultipleSpecialAppendices:
    return "Multiple special appendices that indicate no entity";
  }
  return "Unknown error";
}

namespace {

Callsign fromPrefix(const std::string &call, const Prefix &prefix) {
  Callsign c;
  c.call = call;
  c.adif = prefix.adif;
  c.dxcc = prefix.entity;
  c.cqzone = prefix.cqz;
  c.continent = prefix.cont;
  c.longitude = prefix.lon;
  c.latitude = prefix.lat;
  return c;
}

SpecialEntity specialFromEntityName(const std::string &entity) {
  if (entity == HamCall::ENTITY_MARITIME_MOBILE)
    return SpecialEntity::MaritimeMobile;
  if (entity == HamCall::ENTITY_AERONAUTICAL_MOBILE)
    return SpecialEntity::AeronauticalMobile;
  if (entity == HamCall::ENTITY_SATELLITE)
    return SpecialEntity::Satellite;
  return SpecialEntity::None;
}

Callsign fromException(const std::string &call, const CallsignException &exc) {
  Callsign c;
  c.call = call;
  c.adif = exc.adif;
  c.dxcc = exc.entity;
  c.cqzone = exc.cqz;
  c.continent = exc.cont;
  c.longitude = exc.lon;
  c.latitude = exc.lat;
  if (exc.adif == HamCall::ADIF_NO_DXCC)
    c.special = specialFromEntityName(exc.entity);
  return c;
}

// No DXCC: only call, ADIF 0 and the reason are set
Callsign noEntity(const std::string &call, SpecialEntity special) {
  Callsign c;
  c.call = call;
  c.adif = HamCall::ADIF_NO_DXCC;
  c.special = special;
  return c;
}

bool isMaritimeMobilePrefix(const Prefix &prefix) {
  return prefix.entity == HamCall::ENTITY_MARITIME_MOBILE;
}

SpecialEntity specialFromAppendix(const std::string &part) {
  if (part == HamCall::APPENDIX_MARITIME_MOBILE)
    return SpecialEntity::MaritimeMobile;
  if (part == HamCall::APPENDIX_AERONAUTICAL_MOBILE)
    return SpecialEntity::AeronauticalMobile;
  if (part == HamCall::APPENDIX_SATELLITE)
    return SpecialEntity::Satellite;
  return SpecialEntity::None;
}

// Replace the last digit that has at least one character on each side.
// "SV0ABC" with '9' gives "SV9ABC". Calls without such a digit are returned
// unchanged.
std::string substituteDigit(const std::string &homecall, char digit) {
  if (homecall.size() < 3)
    return homecall;
  for (size_t i = homecall.size() - 2; i >= 1; --i) {
    if (homecall[i] >= '0' && homecall[i] <= '9') {
      std::string out = homecall;
      out[i] = digit;
      return out;
    }
  }
  return homecall;
}

std::vector<std::string> appendixStrings(const std::vector<CallsignPart> &parts) {
  std::vector<std::string> out;
  for (size_t i = 1; i < parts.size(); ++i)
    out.push_back(parts[i].part);
  return out;
}

} // namespace

CallsignAnalyzer::CallsignAnalyzer(const ReferenceQuery &query)
    : query_(query), resolver_(query), segmenter_(query),
      whitelist_(query) {}

bool CallsignAnalyzer::hasValidFormat(const std::string &call) {
  if (call.size() < 2)
    return false;
  // Rejects leading, trailing and doubled '/' as empty parts
  for (const auto &part : StringUtils::splitCallsign(call)) {
    if (!StringUtils::isUpperAlnum(part))
      return false;
  }
  return true;
}

AnalyzeResult CallsignAnalyzer::analyze(const std::string &call,
                                        const Timestamp &t) const {
  if (!hasValidFormat(call)) {
    LOG_D("Analyzer", "{}: {}", call, describe(CallsignError::BasicFormat));
    return CallsignError::BasicFormat;
  }

  if (query_.isInvalidOperation(call, t)) {
    LOG_D("Analyzer", "{}: {}", call, describe(CallsignError::InvalidOperation));
    return CallsignError::InvalidOperation;
  }

  // Exceptions name the exact call and replace everything below
  if (const CallsignException *exc = query_.getCallsignException(call, t)) {
    LOG_T("Analyzer", "{}: callsign exception record {}", call, exc->record);
    return fromException(call, *exc);
  }

  auto parts = segmenter_.segment(call, t);
  ShapeResult shape = CallsignSegmenter::classify(parts);
  if (const auto *err = std::get_if<CallsignError>(&shape)) {
    LOG_D("Analyzer", "{}: {}", call, describe(*err));
    return *err;
  }

  AnalyzeResult result;
  switch (std::get<CallsignShape>(shape)) {
  case CallsignShape::SinglePrefix:
    result = analyzeSinglePrefix(call, t);
    break;
  case CallsignShape::OnePrefix:
    result = analyzeOnePrefix(call, t, parts);
    break;
  case CallsignShape::TwoPrefixes:
    result = analyzeTwoPrefixes(call, t, parts);
    break;
  }

  if (const auto *err = std::get_if<CallsignError>(&result)) {
    LOG_D("Analyzer", "{}: {}", call, describe(*err));
  }
  return result;
}

bool CallsignAnalyzer::isAllowed(const std::string &call, int adif,
                                 const Timestamp &t) const {
  return whitelist_.isAllowed(call, adif, t);
}

AnalyzeResult CallsignAnalyzer::analyzeSinglePrefix(const std::string &call,
                                                    const Timestamp &t) const {
  auto match = resolver_.resolve(call, t);
  if (!match)
    return CallsignError::BeginWithoutPrefix;

  if (isMaritimeMobilePrefix(*match->prefix))
    return noEntity(call, SpecialEntity::MaritimeMobile);

  return withZoneException(fromPrefix(call, *match->prefix), t);
}

AnalyzeResult
CallsignAnalyzer::analyzeOnePrefix(const std::string &call, const Timestamp &t,
                                   const std::vector<CallsignPart> &parts) const {
  const std::string &homecall = parts[0].part;
  auto appendices = appendixStrings(parts);

  auto match = resolver_.resolve(homecall, t, appendices);
  if (!match)
    return CallsignError::BeginWithoutPrefix;

  OnePrefixInput in{call, t, homecall, appendices, *match};

  static const std::array<Stage, 3> stages = {
      &CallsignAnalyzer::specialAppendixStage,
      &CallsignAnalyzer::maritimePrefixStage,
      &CallsignAnalyzer::singleDigitStage,
  };
  for (Stage stage : stages) {
    if (auto settled = (this->*stage)(in))
      return *settled;
  }

  return withZoneException(fromPrefix(call, *match->prefix), t);
}

AnalyzeResult CallsignAnalyzer::analyzeTwoPrefixes(
    const std::string &call, const Timestamp &t,
    const std::vector<CallsignPart> &parts) const {
  auto appendices = appendixStrings(parts);

  auto first = resolver_.resolve(parts[0].part, t, appendices);
  auto second = resolver_.resolve(parts[1].part, t, appendices);
  if (!first)
    return CallsignError::BeginWithoutPrefix;

  // A compound match such as 3D2/R already consumed the second part as its
  // appendix. Otherwise the more specific match wins, the first on a tie.
  // Known to be a heuristic for unusual compound prefixes.
  const PrefixMatch *chosen = &*first;
  if (first->prefix->call.find('/') == std::string::npos && second &&
      second->removed < first->removed) {
    chosen = &*second;
  }

  LOG_T("Analyzer", "{}: prefixes {} ({} removed) vs {} -> {}", call,
        first->prefix->call, first->removed,
        second ? second->prefix->call : std::string("-"),
        chosen->prefix->call);

  return withZoneException(fromPrefix(call, *chosen->prefix), t);
}

std::optional<AnalyzeResult>
CallsignAnalyzer::specialAppendixStage(const OnePrefixInput &in) const {
  SpecialEntity found = SpecialEntity::None;
  int count = 0;
  for (const auto &a : in.appendices) {
    SpecialEntity s = specialFromAppendix(a);
    if (s != SpecialEntity::None) {
      found = s;
      ++count;
    }
  }

  if (count == 0)
    return std::nullopt;
  if (count > 1)
    return AnalyzeResult{CallsignError::MultipleSpecialAppendices};
  return AnalyzeResult{noEntity(in.call, found)};
}

std::optional<AnalyzeResult>
CallsignAnalyzer::maritimePrefixStage(const OnePrefixInput &in) const {
  if (!isMaritimeMobilePrefix(*in.homecallMatch.prefix))
    return std::nullopt;
  return AnalyzeResult{noEntity(in.call, SpecialEntity::MaritimeMobile)};
}

// SV0ABC/9: SV is Greece, but the /9 moves the operation to SV9, Crete.
// Whatever the moved homecall resolves to wins, even a shorter prefix
// (SV9CD/1 is SV); the original match is kept only when nothing resolves.
std::optional<AnalyzeResult>
CallsignAnalyzer::singleDigitStage(const OnePrefixInput &in) const {
  const std::string *digit = nullptr;
  for (const auto &a : in.appendices) {
    if (!StringUtils::isSingleDigit(a))
      continue;
    if (digit)
      return AnalyzeResult{CallsignError::MultipleSingleDigitAppendices};
    digit = &a;
  }
  if (!digit)
    return std::nullopt;

  std::string moved = substituteDigit(in.homecall, (*digit)[0]);
  auto match = resolver_.resolve(moved, in.t, in.appendices);
  if (!match)
    return std::nullopt;

  LOG_T("Analyzer", "{}: digit appendix moves {} to {}", in.call, in.homecall,
        match->prefix->call);
  return AnalyzeResult{withZoneException(fromPrefix(in.call, *match->prefix), in.t)};
}

Callsign CallsignAnalyzer::withZoneException(Callsign callsign,
                                             const Timestamp &t) const {
  if (auto zone = query_.getZoneException(callsign.call, t)) {
    LOG_T("Analyzer", "{}: CQ zone {} by zone exception", callsign.call, *zone);
    callsign.cqzone = zone;
  }
  return callsign;
}
