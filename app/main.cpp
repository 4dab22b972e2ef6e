#include "core/EngineConfig.h"
#include "core/Log.h"
#include "parity/ParityFixture.h"
#include "parity/ParityVerifier.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

static void printUsage() {
  std::fprintf(stderr,
               "usage: lmx_parity [--config <config.json>] <fixture.json|dir>...\n");
}

// Directories expand to their *.json files, sorted by name.
static std::vector<std::string> collectFixtures(const std::vector<std::string> &args) {
  std::vector<std::string> out;
  for (const auto &a : args) {
    std::error_code ec;
    if (!fs::is_directory(a, ec)) {
      out.push_back(a);
      continue;
    }
    std::vector<std::string> inDir;
    for (const auto &e : fs::directory_iterator(a, ec)) {
      if (e.is_regular_file() && e.path().extension() == ".json")
        inDir.push_back(e.path().string());
    }
    std::sort(inDir.begin(), inDir.end());
    out.insert(out.end(), inDir.begin(), inDir.end());
  }
  return out;
}

int main(int argc, char **argv) {
  std::string configPath;
  std::vector<std::string> inputs;

  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (a == "-h" || a == "--help") {
      printUsage();
      return 0;
    } else {
      inputs.emplace_back(a);
    }
  }

  Lmx::EngineConfig cfg{};
  if (!configPath.empty()) {
    auto loaded = Lmx::EngineConfigIO::load(configPath);
    if (!loaded) {
      Lmx::Log::Init();
      Lmx::Log::Error("{}", loaded.error());
      return 2;
    }
    cfg = std::move(*loaded);
  }
  Lmx::Log::Init(cfg.log);

  const std::vector<std::string> fixtures = collectFixtures(inputs);
  if (fixtures.empty()) {
    printUsage();
    return 2;
  }

  size_t failed = 0;
  size_t broken = 0;
  for (const auto &path : fixtures) {
    auto fixture = Lmx::ParityFixtureIO::load(path);
    if (!fixture) {
      Lmx::Log::Error("{}", fixture.error());
      ++broken;
      if (cfg.parity.stopOnFirstFailure)
        break;
      continue;
    }

    const Lmx::ParityReport report = Lmx::verifyFixture(*fixture, cfg.parity);
    if (!report.passed()) {
      ++failed;
      if (cfg.parity.stopOnFirstFailure)
        break;
    }
  }

  Lmx::Log::Info("{} fixtures, {} failed, {} unreadable", fixtures.size(),
                 failed, broken);
  return (failed || broken) ? 1 : 0;
}
