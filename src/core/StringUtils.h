#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace StringUtils {

// Split a callsign into its '/' separated parts.
// Example: splitCallsign("F/W1AW/P") returns {"F", "W1AW", "P"}
std::vector<std::string> splitCallsign(const std::string &call);

// True if s is non-empty and only contains A-Z and 0-9.
bool isUpperAlnum(const std::string &s);

// True if s is exactly one decimal digit.
bool isSingleDigit(const std::string &s);

// True if s is exactly one letter A-Z.
bool isSingleLetter(const std::string &s);

// Parse an UTC timestamp of the form "YYYY-MM-DDTHH:MM:SSZ".
// Returns false and leaves out untouched on failure.
bool parseUtc(const std::string &s, std::chrono::system_clock::time_point &out);

// Format a timestamp as "YYYY-MM-DDTHH:MM:SSZ".
std::string formatUtc(const std::chrono::system_clock::time_point &t);

} // namespace StringUtils
