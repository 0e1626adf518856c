#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

// Optional validity interval. A missing bound is unbounded on that side and
// both bounds are inclusive.
struct TimeWindow {
  std::optional<Timestamp> start;
  std::optional<Timestamp> end;

  bool contains(const Timestamp &t) const {
    if (start && t < *start)
      return false;
    if (end && t > *end)
      return false;
    return true;
  }

  bool intersects(const TimeWindow &other) const {
    // [a, b] and [c, d] intersect unless one ends before the other starts
    if (end && other.start && *end < *other.start)
      return false;
    if (other.end && start && *other.end < *start)
      return false;
    return true;
  }
};

// DXCC entity. The main prefix is informational only, the complete list of
// prefixes lives in ReferenceTable::prefixes.
//
// If whitelist is true only approved callsigns count for this entity. The
// approved calls are the callsign exceptions naming this entity. The whitelist
// bounds are independent from the entity's own validity window and may be
// absent even if the entity is whitelisted.
struct Entity {
  int record = 0;
  int adif = 0;
  std::string name;
  std::string prefix;
  bool deleted = false;
  std::optional<int> cqz;
  std::optional<std::string> cont;
  std::optional<float> lon;
  std::optional<float> lat;
  TimeWindow valid;

  std::optional<bool> whitelist;
  std::optional<Timestamp> whitelistStart;
  std::optional<Timestamp> whitelistEnd;
};

// Callsign prefix such as "DL", or a compound one such as "SV/A".
// The entity name may be one of the sentinels in Constants.h instead of a
// real entity.
struct Prefix {
  int record = 0;
  std::string call;
  std::string entity;
  int adif = 0;
  std::optional<int> cqz;
  std::optional<std::string> cont;
  std::optional<float> lon;
  std::optional<float> lat;
  TimeWindow valid;
};

// Override for one exact callsign including all appendices.
struct CallsignException {
  int record = 0;
  std::string call;
  std::string entity;
  int adif = 0;
  std::optional<int> cqz;
  std::optional<std::string> cont;
  std::optional<float> lon;
  std::optional<float> lat;
  TimeWindow valid;
};

struct InvalidOperation {
  int record = 0;
  std::string call;
  TimeWindow valid;
};

struct ZoneException {
  int record = 0;
  std::string call;
  int zone = 0;
  TimeWindow valid;
};

// Complete reference dataset as delivered by the loader. Timestamps are UTC.
// Built once and read-only afterwards; all query layers borrow from it.
struct ReferenceTable {
  std::optional<Timestamp> date;
  std::vector<Entity> entities;
  std::vector<Prefix> prefixes;
  std::vector<CallsignException> exceptions;
  std::vector<InvalidOperation> invalidOperations;
  std::vector<ZoneException> zoneExceptions;
};

enum class RecordKind {
  Entity,
  Prefix,
  CallsignException,
  InvalidOperation,
  ZoneException
};

const char *recordKindName(RecordKind kind);

// Two records of the same key group whose validity windows intersect.
// Lookups silently take the first one, so the table should not contain any.
struct WindowOverlap {
  RecordKind kind = RecordKind::Prefix;
  std::string key;
  int firstRecord = 0;
  int secondRecord = 0;
};

// Report every overlapping pair, in table order.
std::vector<WindowOverlap> findWindowOverlaps(const ReferenceTable &table);
