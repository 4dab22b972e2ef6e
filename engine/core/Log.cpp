#include "Log.h"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Lmx::Log {

spdlog::level::level_enum ParseLevel(const std::string &name) {
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error")
    return spdlog::level::err;
  if (name == "critical")
    return spdlog::level::critical;
  if (name == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

void Init(const LogConfig &cfg) {
  namespace fs = std::filesystem;

  std::vector<spdlog::sink_ptr> sinks;
  if (cfg.console)
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!cfg.file.empty()) {
    const fs::path p(cfg.file);
    std::error_code ec;
    if (p.has_parent_path())
      fs::create_directories(p.parent_path(), ec);
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(p.string(), true));
  }

  auto logger =
      std::make_shared<spdlog::logger>("lmx", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%T] [%^%l%$] %v");
  spdlog::set_level(ParseLevel(cfg.level));
  spdlog::flush_on(spdlog::level::info);
}

} // namespace Lmx::Log
