#include "WhitelistChecker.h"
#include "../core/Logger.h"

bool WhitelistChecker::isAllowed(const std::string &call, int adif,
                                 const Timestamp &t) const {
  // Not every ADIF id has an entity record (e.g. 0 for /AM), those are never
  // restricted
  const Entity *entity = query_.getEntity(adif, t);
  if (!entity || entity->whitelist != true)
    return true;

  // An exception may approve the call for another entity only
  if (const CallsignException *exc = query_.getCallsignException(call, t)) {
    bool approved = exc->adif == adif;
    LOG_D("Whitelist", "{} exception for adif {} -> {}", call, exc->adif,
          approved ? "approved" : "rejected");
    return approved;
  }

  if (entity->whitelistStart && t < *entity->whitelistStart)
    return true;
  if (entity->whitelistEnd && t > *entity->whitelistEnd)
    return true;

  LOG_D("Whitelist", "{} not approved for whitelisted entity {}", call,
        entity->name);
  return false;
}
