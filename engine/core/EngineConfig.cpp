#include "EngineConfig.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace Lmx {

static bool isKnownLevel(const std::string &s) {
  return s == "trace" || s == "debug" || s == "info" || s == "warn" ||
         s == "warning" || s == "error" || s == "critical" || s == "off";
}

std::expected<EngineConfig, std::string>
EngineConfigIO::parse(const std::string &jsonText) {
  nlohmann::json j =
      nlohmann::json::parse(jsonText, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded())
    return std::unexpected(std::string("config: malformed JSON"));
  if (!j.is_object())
    return std::unexpected(std::string("config: root must be an object"));

  EngineConfig cfg{};

  try {
    if (j.contains("log")) {
      const auto &l = j["log"];
      if (!l.is_object())
        return std::unexpected(std::string("config: 'log' must be an object"));
      cfg.log.level = l.value("level", cfg.log.level);
      cfg.log.file = l.value("file", cfg.log.file);
      cfg.log.console = l.value("console", cfg.log.console);
      if (!isKnownLevel(cfg.log.level))
        return std::unexpected("config: unknown log level '" + cfg.log.level +
                               "'");
    }

    if (j.contains("parity")) {
      const auto &p = j["parity"];
      if (!p.is_object())
        return std::unexpected(
            std::string("config: 'parity' must be an object"));
      cfg.parity.stopOnFirstFailure =
          p.value("stopOnFirstFailure", cfg.parity.stopOnFirstFailure);
      cfg.parity.maxReportedMismatches =
          p.value("maxReportedMismatches", cfg.parity.maxReportedMismatches);
      if (cfg.parity.maxReportedMismatches < 0)
        return std::unexpected(
            std::string("config: maxReportedMismatches must be >= 0"));
    }
  } catch (const nlohmann::json::exception &e) {
    return std::unexpected(std::string("config: ") + e.what());
  }

  return cfg;
}

std::expected<EngineConfig, std::string>
EngineConfigIO::load(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return std::unexpected("config: failed to open " + path);

  std::ostringstream ss;
  ss << in.rdbuf();
  return parse(ss.str());
}

} // namespace Lmx
