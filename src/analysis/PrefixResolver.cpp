#include "PrefixResolver.h"
#include "../core/Logger.h"
#include "../core/StringUtils.h"

std::optional<PrefixMatch>
PrefixResolver::resolve(const std::string &candidate, const Timestamp &t,
                        const std::vector<std::string> &appendices) const {
  if (candidate.empty())
    return std::nullopt;

  std::vector<const std::string *> letters;
  for (const auto &a : appendices) {
    if (StringUtils::isSingleLetter(a))
      letters.push_back(&a);
  }

  // Longest first, so UA9ABC ends up at UA9 and not at U
  for (size_t len = candidate.size(); len >= 1; --len) {
    std::string shortened = candidate.substr(0, len);
    size_t removed = candidate.size() - len;

    for (const auto *letter : letters) {
      std::string compound = shortened + "/" + *letter;
      if (const Prefix *p = query_.getPrefix(compound, t)) {
        LOG_T("PrefixResolver", "{} -> {} (compound, {} removed)", candidate,
              p->call, removed);
        return PrefixMatch{p, removed};
      }
    }

    if (const Prefix *p = query_.getPrefix(shortened, t)) {
      LOG_T("PrefixResolver", "{} -> {} ({} removed)", candidate, p->call,
            removed);
      return PrefixMatch{p, removed};
    }
  }

  return std::nullopt;
}
