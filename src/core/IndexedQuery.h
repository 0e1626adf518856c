#pragma once

#include "ReferenceQuery.h"

#include <unordered_map>
#include <vector>

// Hash index from key to its key group. Each group keeps table order so that
// lookups pick the same record as ScanQuery.
class IndexedQuery : public ReferenceQuery {
public:
  explicit IndexedQuery(const ReferenceTable &table);

  const Entity *getEntity(int adif, const Timestamp &t) const override;
  const Prefix *getPrefix(const std::string &prefix,
                          const Timestamp &t) const override;
  const CallsignException *
  getCallsignException(const std::string &call,
                       const Timestamp &t) const override;
  std::optional<int> getZoneException(const std::string &call,
                                      const Timestamp &t) const override;
  bool isInvalidOperation(const std::string &call,
                          const Timestamp &t) const override;

private:
  template <typename Record>
  using Index = std::unordered_map<std::string, std::vector<const Record *>>;

  std::unordered_map<int, std::vector<const Entity *>> entities_;
  Index<Prefix> prefixes_;
  Index<CallsignException> exceptions_;
  Index<InvalidOperation> invalidOperations_;
  Index<ZoneException> zoneExceptions_;
};
