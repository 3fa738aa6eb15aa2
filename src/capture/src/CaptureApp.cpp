/**
 * @file CaptureApp.cpp
 * @brief Command-line entry implementation.
 */

#include "src/capture/inc/CaptureApp.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <utility>

#include "src/capture/inc/CaptureConfig.hpp"
#include "src/capture/inc/CaptureController.hpp"
#include "src/capture/inc/CaptureErrors.hpp"
#include "src/capture/inc/CaptureLog.hpp"
#include "src/capture/inc/ModeResolver.hpp"
#include "src/capture/inc/Preflight.hpp"

namespace perfcap {
namespace capture {

int runCapture(int argc, char** argv) {
  const std::string PROG = (argc > 0 && argv[0] != nullptr) ? argv[0] : "perfcap";

  try {
    CaptureConfig cfg;
    populateFromEnv(cfg);
    RawFlags flags = parseCaptureFlags(cfg, argc, argv);
    if (flags.help) {
      std::fputs(helpText(PROG).c_str(), stdout);
      return 0;
    }
    setVerboseLogging(cfg.verbose);
    resolveToolchainPaths(cfg);

    Session session = resolveSession(flags);
    runPreflight(cfg);

    CaptureController controller(cfg, std::move(session));
    controller.run();
    return 0;
  } catch (const CaptureError& e) {
    logError("%s", e.what());
  } catch (const std::exception& e) {
    logError("unexpected failure: %s", e.what());
  }
  return 1;
}

} // namespace capture
} // namespace perfcap
