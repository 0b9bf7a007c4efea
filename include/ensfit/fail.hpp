// Copyright Global Phasing Ltd.
//
// fail(), sys_fail(), unreachable() and the exception types of the library.

#ifndef ENSFIT_FAIL_HPP_
#define ENSFIT_FAIL_HPP_

#include <cerrno>     // for errno
#include <stdexcept>  // for runtime_error
#include <string>
#include <system_error>
#include <utility>    // for forward

#if defined(_WIN32) && defined(ENSFIT_SHARED)
# if defined(ENSFIT_BUILD)
#  define ENSFIT_DLL __declspec(dllexport)
# else
#  define ENSFIT_DLL __declspec(dllimport)
# endif
#elif defined(ENSFIT_SHARED) && (defined(__GNUC__) || defined(__clang__))
# define ENSFIT_DLL __attribute__((visibility("default")))
#else
# define ENSFIT_DLL
#endif

#if defined(__GNUC__) || defined(__clang__)
# define ENSFIT_COLD __attribute__((cold))
#else
# define ENSFIT_COLD
#endif

namespace ensfit {

// Atom counts of two frames, of a frame and a mask, etc. disagree.
struct DimensionMismatch : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Fewer than 3 usable (non-collinear) atoms to determine a rotation.
struct InsufficientAtoms : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct SelectionError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct InvalidSelectionSyntax : SelectionError {
  using SelectionError::SelectionError;
};

struct EmptySelection : SelectionError {
  using SelectionError::SelectionError;
};

// A frame or a trajectory segment was rejected by a container.
struct SizeMismatch : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct IOWriteError : std::runtime_error {
  IOWriteError(const std::string& path_, const std::string& msg)
    : std::runtime_error(msg), path(path_) {}
  std::string path;
};

[[noreturn]]
inline void fail(const std::string& msg) { throw std::runtime_error(msg); }

template<typename T, typename... Args> [[noreturn]]
void fail(std::string&& str, T&& arg1, Args&&... args) {
  str += arg1;
  fail(std::move(str), std::forward<Args>(args)...);
}
template<typename T, typename... Args> [[noreturn]]
void fail(const std::string& str, T&& arg1, Args&&... args) {
  fail(str + arg1, std::forward<Args>(args)...);
}

// Throws exception of type E with the message built from all arguments.
template<typename E> [[noreturn]]
void fail_with(const std::string& msg) { throw E(msg); }

template<typename E, typename T, typename... Args> [[noreturn]]
void fail_with(const std::string& str, T&& arg1, Args&&... args) {
  fail_with<E>(str + arg1, std::forward<Args>(args)...);
}

[[noreturn]]
inline ENSFIT_COLD void sys_fail(const std::string& msg) {
  throw std::system_error(errno, std::system_category(), msg);
}
[[noreturn]]
inline ENSFIT_COLD void sys_fail(const char* msg) {
  throw std::system_error(errno, std::system_category(), msg);
}

// unreachable() is used to silence GCC -Wreturn-type and hint the compiler
[[noreturn]] inline void unreachable() {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#elif defined(_MSC_VER)
  __assume(0);
#endif
}

} // namespace ensfit
#endif
