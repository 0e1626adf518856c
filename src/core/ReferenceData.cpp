#include "ReferenceData.h"

#include <string>
#include <unordered_map>

const char *recordKindName(RecordKind kind) {
  switch (kind) {
  case RecordKind::Entity:
    return "entity";
  case RecordKind::Prefix:
    return "prefix";
  case RecordKind::CallsignException:
    return "callsign exception";
  case RecordKind::InvalidOperation:
    return "invalid operation";
  case RecordKind::ZoneException:
    return "zone exception";
  }
  return "unknown";
}

namespace {

// Groups records by key in first-seen order and compares every pair inside a
// group. Groups are small (a handful of historical records), so quadratic is
// fine.
template <typename Record, typename KeyFn>
void collectOverlaps(const std::vector<Record> &records, RecordKind kind,
                     KeyFn keyOf, std::vector<WindowOverlap> &out) {
  std::unordered_map<std::string, std::vector<const Record *>> groups;
  std::vector<std::string> order;

  for (const auto &rec : records) {
    std::string key = keyOf(rec);
    auto &group = groups[key];
    if (group.empty())
      order.push_back(key);
    group.push_back(&rec);
  }

  for (const auto &key : order) {
    const auto &group = groups[key];
    for (size_t i = 0; i < group.size(); ++i) {
      for (size_t j = i + 1; j < group.size(); ++j) {
        if (group[i]->valid.intersects(group[j]->valid)) {
          out.push_back({kind, key, group[i]->record, group[j]->record});
        }
      }
    }
  }
}

} // namespace

std::vector<WindowOverlap> findWindowOverlaps(const ReferenceTable &table) {
  std::vector<WindowOverlap> overlaps;

  collectOverlaps(
      table.entities, RecordKind::Entity,
      [](const Entity &e) { return std::to_string(e.adif); }, overlaps);
  collectOverlaps(
      table.prefixes, RecordKind::Prefix,
      [](const Prefix &p) { return p.call; }, overlaps);
  collectOverlaps(
      table.exceptions, RecordKind::CallsignException,
      [](const CallsignException &e) { return e.call; }, overlaps);
  collectOverlaps(
      table.invalidOperations, RecordKind::InvalidOperation,
      [](const InvalidOperation &o) { return o.call; }, overlaps);
  collectOverlaps(
      table.zoneExceptions, RecordKind::ZoneException,
      [](const ZoneException &z) { return z.call; }, overlaps);

  return overlaps;
}
