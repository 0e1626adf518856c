#include "ScanQuery.h"

#include <algorithm>

namespace {

template <typename Record, typename Pred>
const Record *findActive(const std::vector<Record> &records, const Timestamp &t,
                         Pred matchesKey) {
  auto it = std::find_if(records.begin(), records.end(),
                         [&](const Record &r) {
                           return matchesKey(r) && r.valid.contains(t);
                         });
  return it != records.end() ? &(*it) : nullptr;
}

} // namespace

const Entity *ScanQuery::getEntity(int adif, const Timestamp &t) const {
  return findActive(table_.entities, t,
                    [adif](const Entity &e) { return e.adif == adif; });
}

const Prefix *ScanQuery::getPrefix(const std::string &prefix,
                                   const Timestamp &t) const {
  return findActive(table_.prefixes, t,
                    [&prefix](const Prefix &p) { return p.call == prefix; });
}

const CallsignException *
ScanQuery::getCallsignException(const std::string &call,
                                const Timestamp &t) const {
  return findActive(
      table_.exceptions, t,
      [&call](const CallsignException &e) { return e.call == call; });
}

std::optional<int> ScanQuery::getZoneException(const std::string &call,
                                               const Timestamp &t) const {
  const ZoneException *exc = findActive(
      table_.zoneExceptions, t,
      [&call](const ZoneException &z) { return z.call == call; });
  if (!exc)
    return std::nullopt;
  return exc->zone;
}

bool ScanQuery::isInvalidOperation(const std::string &call,
                                   const Timestamp &t) const {
  return findActive(table_.invalidOperations, t,
                    [&call](const InvalidOperation &o) {
                      return o.call == call;
                    }) != nullptr;
}
