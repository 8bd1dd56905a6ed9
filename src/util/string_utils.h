#ifndef SCENELINK_STRING_UTILS_H
#define SCENELINK_STRING_UTILS_H

#include <ctype.h>
#include <stddef.h>

#include <string>
#include <vector>

#include <etl/algorithm.h>

namespace scenelink {
namespace util {

inline std::string toLower(const std::string& value) {
  std::string out(value);
  etl::transform(out.begin(), out.end(), out.begin(), [](char c) {
    return static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

inline bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (::tolower(static_cast<unsigned char>(a[i])) !=
        ::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

inline bool startsWith(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Strip leading/trailing whitespace and any of the given characters.
 *
 * Used to unwrap bracketed wire values such as "[1, 2, 3]" or "(1,2)".
 */
inline std::string trim(const std::string& value, const char* extra = "") {
  auto strip = [extra](char c) {
    if (::isspace(static_cast<unsigned char>(c))) {
      return true;
    }
    for (const char* p = extra; *p != '\0'; ++p) {
      if (*p == c) {
        return true;
      }
    }
    return false;
  };
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && strip(value[begin])) {
    ++begin;
  }
  while (end > begin && strip(value[end - 1])) {
    --end;
  }
  return value.substr(begin, end - begin);
}

// Splits on a single separator; empty fields are kept.
inline std::vector<std::string> split(const std::string& value, char separator) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = value.find(separator, start);
    if (pos == std::string::npos) {
      parts.push_back(value.substr(start));
      break;
    }
    parts.push_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

// Last path component without its extension ("Assets/A/Player.prefab" -> "Player").
inline std::string fileStem(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
  const size_t dot = name.find_last_of('.');
  if (dot != std::string::npos && dot > 0) {
    name.erase(dot);
  }
  return name;
}

inline std::string parentDirectory(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  return (slash == std::string::npos) ? std::string() : path.substr(0, slash);
}

}  // namespace util
}  // namespace scenelink

#endif  // SCENELINK_STRING_UTILS_H
