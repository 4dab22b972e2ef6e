#include "ParityVerifier.h"

#include "core/Log.h"
#include "render/Compositor.h"

namespace Lmx {

ParityReport verifyFixture(const ParityFixture &fixture,
                           const ParityConfig &cfg) {
  ParityReport report{};
  report.fixture = fixture.name;

  const size_t maxReported =
      cfg.maxReportedMismatches > 0 ? size_t(cfg.maxReportedMismatches) : 0;

  for (const auto &[frame, want] : fixture.expected) {
    const PixelBuffer got = Compositor::render(fixture.stack, frame);
    ++report.framesChecked;

    FrameMismatch m{};
    m.frame = frame;
    for (size_t i = 0; i < want.size(); ++i) {
      if (got[i] == want[i])
        continue;
      ++m.differing;
      if (m.pixels.size() < maxReported)
        m.pixels.push_back(i);
    }
    if (m.differing == 0)
      continue;

    const size_t first = m.pixels.empty() ? 0 : m.pixels.front();
    Log::Warn("[{}] frame {}: {} pixels differ (first at {})", fixture.name,
              frame, m.differing, first);
    report.mismatches.push_back(std::move(m));

    if (cfg.stopOnFirstFailure)
      break;
  }

  if (report.passed())
    Log::Info("[{}] ok ({} frames)", fixture.name, report.framesChecked);
  else
    Log::Error("[{}] FAILED: {} of {} frames differ", fixture.name,
               report.mismatches.size(), report.framesChecked);
  return report;
}

} // namespace Lmx
