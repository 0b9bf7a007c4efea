// Copyright Global Phasing Ltd.

#include <ensfit/sprintf.hpp>
#include <stdarg.h>  // for va_list

#define STB_SPRINTF_IMPLEMENTATION
#define STB_SPRINTF_STATIC
#define STB_SPRINTF_NOUNALIGNED 1
#if defined(__GNUC__)
# pragma GCC diagnostic ignored "-Wunused-function"
#endif
#if defined(__clang__)
# pragma clang diagnostic ignored "-Wunused-function"
#endif
#include <stb/stb_sprintf.h>

namespace ensfit {

int snprintf_z(char *buf, int count, char const *fmt, ...) {
  va_list va;
  va_start(va, fmt);
  int result = STB_SPRINTF_DECORATE(vsnprintf)(buf, count, fmt, va);
  va_end(va);
  // length of the output, which may be truncated
  return result < count ? result : count - 1;
}

} // namespace ensfit
