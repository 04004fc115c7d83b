#pragma once

#include "util/CppUtil.hpp"
#include "util/Exceptions.hpp"

#include <format>
#include <source_location>

/*
 * Assertion macros:
 *
 * - DEBUG_ASSERT() - throws util::DebugAssertionError if the condition is false. Only active when
 *   DEBUG_BUILD is defined to 1.
 *
 * - RELEASE_ASSERT() - throws util::ReleaseAssertionError if the condition is false. Always active.
 *
 * Each variant accepts either a lone condition, or a condition followed by a std::format() string
 * and its arguments.
 *
 * Unlike assert(), the arguments of a disabled DEBUG_ASSERT() are still compiled (so they cannot
 * silently rot), but are never evaluated.
 */

#define DEBUG_ASSERT(COND, ...)                                                                    \
  do {                                                                                             \
    if (IS_DEFINED(DEBUG_BUILD)) {                                                                 \
      util::detail::assert_impl<util::DebugAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
    }                                                                                              \
  } while (0)

#define RELEASE_ASSERT(COND, ...)                                                                  \
  do {                                                                                             \
    util::detail::assert_impl<util::ReleaseAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
  } while (0)

namespace util {
namespace detail {

template <typename ExceptionT, typename... Ts>
void assert_impl(const char* cond_str, const std::source_location& loc, bool cond,
                 std::format_string<Ts...> fmt, Ts&&... ts);

template <typename ExceptionT>
void assert_impl(const char* cond_str, const std::source_location& loc, bool cond);

}  // namespace detail
}  // namespace util

#include "inline/util/Asserts.inl"
