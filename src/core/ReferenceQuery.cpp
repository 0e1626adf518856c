#include "ReferenceQuery.h"
#include "IndexedQuery.h"
#include "ScanQuery.h"

const char *queryBackendName(QueryBackend backend) {
  switch (backend) {
  case QueryBackend::Scan:
    return "scan";
  case QueryBackend::Indexed:
    return "indexed";
  }
  return "unknown";
}

std::unique_ptr<ReferenceQuery> makeReferenceQuery(const ReferenceTable &table,
                                                   QueryBackend backend) {
  if (backend == QueryBackend::Scan)
    return std::make_unique<ScanQuery>(table);
  return std::make_unique<IndexedQuery>(table);
}
