// Copyright Global Phasing Ltd.
//
// snprintf_z: locale-independent snprintf from stb_sprintf,
// used for fixed-column output.

#ifndef ENSFIT_SPRINTF_HPP_
#define ENSFIT_SPRINTF_HPP_

#include "fail.hpp"  // for ENSFIT_DLL

namespace ensfit {

#if (defined(__GNUC__) && !defined(__MINGW32__)) || defined(__clang__)
# define ENSFIT_ATTRIBUTE_FORMAT(fmt,va) __attribute__((format(printf,fmt,va)))
#else
# define ENSFIT_ATTRIBUTE_FORMAT(fmt,va)
#endif
/// Like snprintf, but ignores locale and the output is always
/// zero-terminated (hence _z). Returns the length of the output.
ENSFIT_DLL int snprintf_z(char *buf, int count, char const *fmt, ...)
                                                         ENSFIT_ATTRIBUTE_FORMAT(3,4);

} // namespace ensfit
#endif
