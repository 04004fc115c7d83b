#include "util/Asserts.hpp"

namespace util {
namespace detail {

template <typename ExceptionT, typename... Ts>
inline void assert_impl([[maybe_unused]] const char* cond_str, const std::source_location& loc,
                        bool cond, std::format_string<Ts...> fmt, Ts&&... ts) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(),
                     std::format(fmt, std::forward<Ts>(ts)...), loc.file_name(), loc.line());
  }
}

template <typename ExceptionT>
inline void assert_impl(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(), cond_str, loc.file_name(),
                     loc.line());
  }
}

}  // namespace detail
}  // namespace util
