#include "util/StringUtil.hpp"

#include "util/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

namespace util {

inline int atoi_safe(const std::string& s) {
  int value = 0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (s.empty() || ec != std::errc() || ptr != last) {
    throw util::CleanException("{}(\"{}\") failure", __func__, s);
  }
  return value;
}

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  std::string_view sep(t);

  if (sep.empty()) {
    std::string_view sv(s);
    std::size_t pos = 0, n = sv.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      result.emplace_back(sv.substr(start, pos - start));
    }
  } else {
    std::size_t start = 0, end;
    while ((end = s.find(sep, start)) != std::string::npos) {
      result.emplace_back(s.data() + start, end - start);
      start = end + sep.size();
    }
    // last segment
    result.emplace_back(s.data() + start, s.size() - start);
  }

  return result;
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace util
