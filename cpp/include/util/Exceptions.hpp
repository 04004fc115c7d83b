#pragma once

#include <exception>
#include <format>
#include <string>
#include <utility>

namespace util {

/*
 * Like std::runtime_error, but constructed with std::format() mechanics:
 *
 * throw util::Exception("bad cell ({}, {})", row, col);
 */
class Exception : public std::exception {
 public:
  Exception() : std::exception() {}

  template <typename... Ts>
  Exception(std::format_string<Ts...> fmt, Ts&&... ts) : std::exception() {
    what_ = std::format(fmt, std::forward<Ts>(ts)...);
  }
  char const* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * Thrown for errors that are the caller's fault rather than a bug in this program: an illegal move,
 * an unparseable state blob, a bad cmdline flag.
 *
 * Callers at a boundary (a main(), a request handler) catch util::CleanException and report the
 * message. Anything else reaching the boundary is a bug, and is allowed to propagate.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// Used for DEBUG_ASSERT() statements.
class DebugAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "DEBUG_ASSERT"; }
  using Exception::Exception;
};

// Used for RELEASE_ASSERT() statements.
class ReleaseAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "RELEASE_ASSERT"; }
  using Exception::Exception;
};

}  // namespace util
