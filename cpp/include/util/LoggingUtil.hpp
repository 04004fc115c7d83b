#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// The logging macros are LOG_TRACE(), LOG_DEBUG(), LOG_INFO(), LOG_WARN(), and LOG_ERROR().
//
// They take a format string followed by its arguments:
//
// LOG_INFO("New game (difficulty={})", name);
// LOG_DEBUG("searched {} nodes", n);
//
// Statements below SPDLOG_ACTIVE_LEVEL are compiled out. The default build keeps INFO and above;
// configure with -DSPDLOG_ACTIVE_LEVEL=SPDLOG_LEVEL_DEBUG to see LOG_DEBUG() output.

#define LOG_TRACE(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_TRACE(__VA_ARGS__);    \
  } while (0)

#define LOG_DEBUG(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_DEBUG(__VA_ARGS__);    \
  } while (0)

#define LOG_INFO(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_INFO(__VA_ARGS__);     \
  } while (0)

#define LOG_WARN(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_WARN(__VA_ARGS__);     \
  } while (0)

#define LOG_ERROR(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_ERROR(__VA_ARGS__);    \
  } while (0)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;

    // Not a cmdline option. Programs that speak a protocol on stdout set this so that log lines
    // go to stderr instead.
    bool console_to_stderr = false;

    auto make_options_description();
  };

  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
