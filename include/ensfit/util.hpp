// Copyright Global Phasing Ltd.
//
// String utilities: cat() for messages and helpers for parsing.

#ifndef ENSFIT_UTIL_HPP_
#define ENSFIT_UTIL_HPP_

#include <algorithm>  // for equal
#include <cctype>     // for tolower
#include <iterator>   // for begin, end
#include <string>

namespace ensfit {

// cat() converts and concatenates its arguments into std::string.
inline void cat_to(std::string&) {}
template <typename... Args>
void cat_to(std::string& out, const int& value, Args const&... args);
template <typename... Args>
void cat_to(std::string& out, const size_t& value, Args const&... args);
template <typename... Args>
void cat_to(std::string& out, const double& value, Args const&... args);
template <typename T, typename... Args>
void cat_to(std::string& out, const T& value, Args const&... args) {
  out += value;
  cat_to(out, args...);
}
template <typename... Args>
void cat_to(std::string& out, const int& value, Args const&... args) {
  out += std::to_string(value);
  cat_to(out, args...);
}
template <typename... Args>
void cat_to(std::string& out, const size_t& value, Args const&... args) {
  out += std::to_string(value);
  cat_to(out, args...);
}
template <typename... Args>
void cat_to(std::string& out, const double& value, Args const&... args) {
  out += std::to_string(value);
  cat_to(out, args...);
}
template <class... Args>
std::string cat(Args const&... args) {
  std::string out;
  cat_to(out, args...);
  return out;
}

inline bool iends_with(const std::string& str, const std::string& suffix) {
  size_t sl = suffix.length();
  return str.length() >= sl &&
         std::equal(std::begin(suffix), std::end(suffix), str.end() - sl,
                    [](char c1, char c2) { return c1 == std::tolower(c2); });
}

inline char alpha_up(char c) { return c & ~0x20; }

inline std::string trim_str(const std::string& str) {
  std::string ws = " \r\n\t";
  std::string::size_type first = str.find_first_not_of(ws);
  if (first == std::string::npos)
    return std::string{};
  std::string::size_type last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

inline bool is_in_list(const std::string& name, const std::string& list,
                       char sep=',') {
  if (name.length() >= list.length())
    return name == list;
  for (size_t start=0, end=0; end != std::string::npos; start=end+1) {
    end = list.find(sep, start);
    if (list.compare(start, end - start, name) == 0)
      return true;
  }
  return false;
}

} // namespace ensfit
#endif
