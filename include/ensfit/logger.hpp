// Copyright Global Phasing Ltd.
//
// Logger: passes progress messages and warnings to a callback.

#ifndef ENSFIT_LOGGER_HPP_
#define ENSFIT_LOGGER_HPP_

#include <cstdio>      // for fprintf
#include <functional>  // for function
#include "fail.hpp"    // for ENSFIT_COLD
#include "util.hpp"    // for cat

namespace ensfit {

/// Messages from the library go through a callback, one line at a time
/// (no trailing newline). Levels follow syslog: 8=debug, 6=info,
/// 5=notice, 3=warning. Rank-deficient fits, unmatched chains and skipped
/// driver items are warnings or notes, never exceptions.
/// Without a callback all messages are dropped.
struct Logger {
  std::function<void(const std::string&)> callback;
  /// messages with level <= threshold are passed; 0 passes nothing
  int threshold = 6;

  template<int N, class... Args> void level(Args const&... args) const {
    if (threshold >= N && callback)
      callback(cat(args...));
  }

  template<class... Args> void debug(Args const&... args) const { level<8>("Debug: ", args...); }
  template<class... Args> void mesg(Args const&... args) const { level<6>(args...); }
  template<class... Args> void note(Args const&... args) const { level<5>("Note: ", args...); }
  template<class... Args> ENSFIT_COLD void warn(Args const&... args) const {
    level<3>("Warning: ", args...);
  }

  /// usage: logger.callback = Logger::to_stderr;
  static void to_stderr(const std::string& s) {
    std::fprintf(stderr, "%s\n", s.c_str());
  }
};

} // namespace ensfit
#endif
