#pragma once

#include "ReferenceData.h"

#include <memory>
#include <optional>
#include <string>

enum class QueryBackend { Scan, Indexed };

const char *queryBackendName(QueryBackend backend);

// Read access to a ReferenceTable at a point in time.
//
// Every getter returns the first record of the key group (in table order)
// whose validity window contains the timestamp, or nullptr. Returned pointers
// borrow from the table and stay valid as long as the table does.
// Implementations only read and may be shared between threads.
class ReferenceQuery {
public:
  virtual ~ReferenceQuery() = default;

  virtual const Entity *getEntity(int adif, const Timestamp &t) const = 0;

  // Lookup by exact prefix string, like "DL" or "SV/A".
  virtual const Prefix *getPrefix(const std::string &prefix,
                                  const Timestamp &t) const = 0;

  // Lookup by complete callsign including prefix and appendices.
  virtual const CallsignException *
  getCallsignException(const std::string &call, const Timestamp &t) const = 0;

  virtual std::optional<int> getZoneException(const std::string &call,
                                              const Timestamp &t) const = 0;

  virtual bool isInvalidOperation(const std::string &call,
                                  const Timestamp &t) const = 0;
};

// The table must outlive the returned query.
std::unique_ptr<ReferenceQuery> makeReferenceQuery(const ReferenceTable &table,
                                                   QueryBackend backend);
