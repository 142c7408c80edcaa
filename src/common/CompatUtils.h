#ifndef COMPAT_UTILS_H
#define COMPAT_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>

namespace tractoscore {
namespace compat {

// C++17 compatible string ends_with function
inline bool ends_with(const std::string &str, const std::string &suffix) {
  if (suffix.length() > str.length()) {
    return false;
  }
  return str.compare(str.length() - suffix.length(), suffix.length(),
                     suffix) == 0;
}

// C++17 compatible string starts_with function
inline bool starts_with(const std::string &str, const std::string &prefix) {
  if (prefix.length() > str.length()) {
    return false;
  }
  return str.compare(0, prefix.length(), prefix) == 0;
}

inline std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

inline std::string to_upper(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return str;
}

inline std::string trim(const std::string &str) {
  const auto first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  const auto last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

} // namespace compat
} // namespace tractoscore

#endif // COMPAT_UTILS_H
