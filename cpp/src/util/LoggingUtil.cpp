#include "util/LoggingUtil.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  std::vector<spdlog::sink_ptr> sinks;

  const char* format = params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";

  spdlog::sink_ptr console_sink;
  if (params.console_to_stderr) {
    console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  console_sink->set_pattern(format);
  sinks.push_back(console_sink);

  if (!params.log_filename.empty()) {
    auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, !params.append_mode);
    file_sink->set_pattern(format);
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);

  spdlog::flush_on(spdlog::level::debug);

  // filtering is done at compile-time via SPDLOG_ACTIVE_LEVEL
  spdlog::set_level(spdlog::level::trace);
}

}  // namespace util
