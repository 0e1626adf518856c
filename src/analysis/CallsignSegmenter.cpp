#include "CallsignSegmenter.h"
#include "../core/Constants.h"
#include "../core/StringUtils.h"

namespace {

enum class State { NoPrefix, SinglePrefix, PrefixComplete };

} // namespace

bool CallsignSegmenter::isReservedAppendix(const std::string &part) {
  for (const char *reserved : HamCall::RESERVED_APPENDICES) {
    if (part == reserved)
      return true;
  }
  return false;
}

std::vector<CallsignPart> CallsignSegmenter::segment(const std::string &call,
                                                     const Timestamp &t) const {
  std::vector<CallsignPart> parts;
  auto raw = StringUtils::splitCallsign(call);
  parts.reserve(raw.size());

  for (size_t pos = 0; pos < raw.size(); ++pos) {
    CallsignPart el;
    el.part = raw[pos];
    bool known = resolver_.resolve(el.part, t).has_value();
    if (known && !(pos >= 1 && isReservedAppendix(el.part))) {
      el.type = PartType::Prefix;
    }
    parts.push_back(std::move(el));
  }
  return parts;
}

ShapeResult CallsignSegmenter::classify(const std::vector<CallsignPart> &parts) {
  State state = State::NoPrefix;
  int prefixes = 0;

  for (const auto &el : parts) {
    bool isPrefix = el.type == PartType::Prefix;
    switch (state) {
    case State::NoPrefix:
      if (!isPrefix)
        return CallsignError::BeginWithoutPrefix;
      state = State::SinglePrefix;
      prefixes = 1;
      break;
    case State::SinglePrefix:
      state = State::PrefixComplete;
      if (isPrefix)
        prefixes = 2;
      break;
    case State::PrefixComplete:
      if (isPrefix)
        return CallsignError::ThirdPrefix;
      break;
    }
  }

  if (state == State::NoPrefix)
    return CallsignError::BeginWithoutPrefix;
  if (state == State::SinglePrefix)
    return CallsignShape::SinglePrefix;
  return prefixes == 2 ? CallsignShape::TwoPrefixes : CallsignShape::OnePrefix;
}
