// Copyright Global Phasing Ltd.
//
// Locale-independent reading of fixed-column fields, as in PDB records,
// and the hybrid-36 encoding of serial numbers and residue numbers.
// Floating-point numbers are parsed with fast_float.

#ifndef ENSFIT_COLUMNS_HPP_
#define ENSFIT_COLUMNS_HPP_

#include <cstdlib>    // for strtol
#include <cstring>    // for memcpy
#include <stdexcept>  // for invalid_argument
#include <string>
#include <fast_float/fast_float.h>

namespace ensfit {

// equivalent of std::isspace for C locale (no handling of EOF)
inline bool is_space(char c) {
  return c == ' ' || (c >= '\t' && c <= '\r');
}

inline bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

// No checking for overflow.
// If length != 0 reads at most length characters.
inline int string_to_int(const char* p, bool checked, size_t length=0) {
  int mult = -1;
  int n = 0;
  size_t i = 0;
  while ((length == 0 || i < length) && is_space(p[i]))
    ++i;
  if (p[i] == '-') {
    mult = 1;
    ++i;
  } else if (p[i] == '+') {
    ++i;
  }
  bool has_digits = false;
  // use negative numbers because INT_MIN < -INT_MAX
  for (; (length == 0 || i < length) && is_digit(p[i]); ++i) {
    n = n * 10 - (p[i] - '0');
    has_digits = true;
  }
  if (checked) {
    while ((length == 0 || i < length) && is_space(p[i]))
      ++i;
    if (!has_digits || (length == 0 ? p[i] != '\0' : i != length))
      throw std::invalid_argument("not an integer: " +
                                  std::string(p, length ? length : i+1));
  }
  return mult * n;
}

inline int string_to_int(const std::string& str, bool checked) {
  return string_to_int(str.c_str(), checked);
}

using fast_float::from_chars_result;

inline from_chars_result fast_from_chars(const char* start, const char* end, double& d) {
  while (start < end && is_space(*start))
    ++start;
  if (start < end && *start == '+')
    ++start;
  return fast_float::from_chars(start, end, d);
}

// Field readers. A field ends early at the end of line.

inline int read_int(const char* p, int field_length) {
  return string_to_int(p, false, field_length);
}

/// Returns 0 if the field is blank or malformed.
inline double read_double(const char* p, int field_length) {
  double d = 0.;
  fast_from_chars(p, p + field_length, d);
  return d;
}

/// Returns the field with leading and trailing whitespace removed.
inline std::string read_string(const char* p, int field_length) {
  while (field_length != 0 && is_space(*p)) {
    ++p;
    --field_length;
  }
  for (int i = 0; i < field_length; ++i)
    if (p[i] == '\n' || p[i] == '\r' || p[i] == '\0') {
      field_length = i;
      break;
    }
  while (field_length != 0 && is_space(p[field_length-1]))
    --field_length;
  return std::string(p, field_length);
}

// Hybrid-36: numbers that don't fit in `width` decimal digits continue
// as A000..ZZZZ, then as a000..zzzz (width 4 shown).

namespace impl {
inline int pow_int(int base, int n) {
  int r = 1;
  while (n-- > 0)
    r *= base;
  return r;
}
} // namespace impl

/// width is 4 (residue number) or 5 (atom serial number).
inline int read_hybrid36(const char* p, int width) {
  const char* start = p;
  while (start < p + width && *start == ' ')
    ++start;
  if (start == p + width || *start < 'A')
    return read_int(p, width);
  char buf[8] = {0};
  std::memcpy(buf, p, width);
  int n = (int) std::strtol(buf, nullptr, 36) - 10 * impl::pow_int(36, width - 1)
          + impl::pow_int(10, width);
  if (p[0] >= 'a')
    n += 26 * impl::pow_int(36, width - 1);
  return n;
}

/// Writes exactly width characters (no terminating null) to out.
/// Numbers outside of the hybrid-36 range are written as asterisks.
inline void write_hybrid36(int value, int width, char* out) {
  static const char digits_upper[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  static const char digits_lower[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  int decimal_limit = impl::pow_int(10, width);
  int block = 26 * impl::pow_int(36, width - 1);
  if (value < decimal_limit && value > -decimal_limit / 10) {
    bool negative = value < 0;
    unsigned n = negative ? -value : value;
    int i = width;
    do {
      out[--i] = char('0' + n % 10);
      n /= 10;
    } while (n != 0);
    if (negative)
      out[--i] = '-';
    while (i > 0)
      out[--i] = ' ';
    return;
  }
  const char* digits = digits_upper;
  value -= decimal_limit;
  if (value >= block) {
    value -= block;
    digits = digits_lower;
  }
  if (value >= block) {
    for (int i = 0; i != width; ++i)
      out[i] = '*';
    return;
  }
  value += 10 * impl::pow_int(36, width - 1);
  for (int i = width; i-- != 0; value /= 36)
    out[i] = digits[value % 36];
}

} // namespace ensfit
#endif
