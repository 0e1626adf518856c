#include "IndexedQuery.h"

namespace {

template <typename Map, typename Record, typename KeyFn>
void buildIndex(Map &index, const std::vector<Record> &records, KeyFn keyOf) {
  index.reserve(records.size());
  for (const auto &rec : records) {
    index[keyOf(rec)].push_back(&rec);
  }
}

template <typename Map, typename Key>
auto findActive(const Map &index, const Key &key, const Timestamp &t) ->
    typename Map::mapped_type::value_type {
  auto it = index.find(key);
  if (it == index.end())
    return nullptr;
  for (const auto *rec : it->second) {
    if (rec->valid.contains(t))
      return rec;
  }
  return nullptr;
}

} // namespace

IndexedQuery::IndexedQuery(const ReferenceTable &table) {
  buildIndex(entities_, table.entities, [](const Entity &e) { return e.adif; });
  buildIndex(prefixes_, table.prefixes, [](const Prefix &p) { return p.call; });
  buildIndex(exceptions_, table.exceptions,
             [](const CallsignException &e) { return e.call; });
  buildIndex(invalidOperations_, table.invalidOperations,
             [](const InvalidOperation &o) { return o.call; });
  buildIndex(zoneExceptions_, table.zoneExceptions,
             [](const ZoneException &z) { return z.call; });
}

const Entity *IndexedQuery::getEntity(int adif, const Timestamp &t) const {
  return findActive(entities_, adif, t);
}

const Prefix *IndexedQuery::getPrefix(const std::string &prefix,
                                      const Timestamp &t) const {
  return findActive(prefixes_, prefix, t);
}

const CallsignException *
IndexedQuery::getCallsignException(const std::string &call,
                                   const Timestamp &t) const {
  return findActive(exceptions_, call, t);
}

std::optional<int> IndexedQuery::getZoneException(const std::string &call,
                                                  const Timestamp &t) const {
  const ZoneException *exc = findActive(zoneExceptions_, call, t);
  if (!exc)
    return std::nullopt;
  return exc->zone;
}

bool IndexedQuery::isInvalidOperation(const std::string &call,
                                      const Timestamp &t) const {
  return findActive(invalidOperations_, call, t) != nullptr;
}
