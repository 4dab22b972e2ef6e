#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>

namespace Lmx {

struct LogConfig final {
  std::string level = "info";
  std::string file;     // empty = no file sink
  bool console = true;
};

} // namespace Lmx

namespace Lmx::Log {

void Init(const LogConfig &cfg = {});

// Maps "trace|debug|info|warn|error|critical|off" onto spdlog levels.
// Unknown names fall back to info.
spdlog::level::level_enum ParseLevel(const std::string &name);

template <class... Args>
inline void Info(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::info(f, std::forward<Args>(args)...);
}

template <class... Args>
inline void Warn(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::warn(f, std::forward<Args>(args)...);
}

template <class... Args>
inline void Error(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::error(f, std::forward<Args>(args)...);
}

template <class... Args>
inline void Debug(fmt::format_string<Args...> f, Args&&... args) {
  spdlog::debug(f, std::forward<Args>(args)...);
}

} // namespace Lmx::Log
