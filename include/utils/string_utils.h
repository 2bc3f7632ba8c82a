#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline std::string replaceAll(std::string str, std::string_view from,
                              std::string_view to) {
  if (from.empty())
    return str;
  size_t pos = 0;
  while ((pos = str.find(from, pos)) != std::string::npos) {
    str.replace(pos, from.size(), to);
    pos += to.size();
  }
  return str;
}

// Splits on '\n' after folding "\r\n" to "\n". A trailing newline yields a
// final empty element.
inline std::vector<std::string> splitLines(std::string_view text) {
  std::string normalized = replaceAll(std::string{text}, "\r\n", "\n");
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t end = normalized.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(normalized.substr(start));
      break;
    }
    lines.push_back(normalized.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

} // namespace StringUtils

#endif
