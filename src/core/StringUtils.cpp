#include "StringUtils.h"

#include <cstdio>
#include <ctime>

namespace StringUtils {

std::vector<std::string> splitCallsign(const std::string &call) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = call.find('/', start);
    if (pos == std::string::npos) {
      parts.push_back(call.substr(start));
      break;
    }
    parts.push_back(call.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

bool isUpperAlnum(const std::string &s) {
  if (s.empty())
    return false;
  for (char c : s) {
    bool upper = c >= 'A' && c <= 'Z';
    bool digit = c >= '0' && c <= '9';
    if (!upper && !digit)
      return false;
  }
  return true;
}

bool isSingleDigit(const std::string &s) {
  return s.size() == 1 && s[0] >= '0' && s[0] <= '9';
}

bool isSingleLetter(const std::string &s) {
  return s.size() == 1 && s[0] >= 'A' && s[0] <= 'Z';
}

bool parseUtc(const std::string &s,
              std::chrono::system_clock::time_point &out) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int consumed = -1;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ%n", &year, &month, &day,
                  &hour, &minute, &second, &consumed) != 6)
    return false;
  if (consumed < 0 || static_cast<size_t>(consumed) != s.size())
    return false;
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60)
    return false;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

#ifdef _WIN32
  std::time_t tt = _mkgmtime(&tm);
#else
  std::time_t tt = timegm(&tm);
#endif
  if (tt == static_cast<std::time_t>(-1))
    return false;

  out = std::chrono::system_clock::from_time_t(tt);
  return true;
}

std::string formatUtc(const std::chrono::system_clock::time_point &t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

} // namespace StringUtils
