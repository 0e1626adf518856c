#pragma once

#include "../core/Constants.h"

#include <optional>
#include <string>

// Which rule detached a callsign from its entity
enum class SpecialEntity { None, MaritimeMobile, AeronauticalMobile, Satellite };

// Result of a callsign analysis. Owns copies of everything it reports, no
// reference into the reference table is kept.
struct Callsign {
  std::string call;
  int adif = HamCall::ADIF_NO_DXCC;
  std::optional<std::string> dxcc; // entity name
  std::optional<int> cqzone;
  std::optional<std::string> continent;
  std::optional<float> longitude;
  std::optional<float> latitude;
  SpecialEntity special = SpecialEntity::None;

  // True for calls without DXCC, like /AM, /MM or /SAT operations
  bool isSpecialEntity() const { return adif == HamCall::ADIF_NO_DXCC; }

  bool operator==(const Callsign &other) const {
    return call == other.call && adif == other.adif && dxcc == other.dxcc &&
           cqzone == other.cqzone && continent == other.continent &&
           longitude == other.longitude && latitude == other.latitude &&
           special == other.special;
  }
  bool operator!=(const Callsign &other) const { return !(*this == other); }
};

// Reasons for rejecting a callsign
enum class CallsignError {
  BasicFormat,
  InvalidOperation,
  BeginWithoutPrefix,
  ThirdPrefix,
  MultipleSingleDigitAppendices,
  MultipleSpecialAppendices
};

const char *describe(CallsignError error);
