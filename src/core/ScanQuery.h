#pragma once

#include "ReferenceQuery.h"

// Linear scan over the complete table for every lookup. O(n) per call, no
// setup cost.
class ScanQuery : public ReferenceQuery {
public:
  explicit ScanQuery(const ReferenceTable &table) : table_(table) {}

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
  const ReferenceTable &table_;
};
