/**
 * @file Preflight.cpp
 * @brief Environment checks.
 */

#include "src/capture/inc/Preflight.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <unistd.h>

#include "src/capture/inc/CaptureErrors.hpp"
#include "src/capture/inc/CaptureLog.hpp"

namespace perfcap {
namespace capture {

namespace {

std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

bool isExecutableFile(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

bool isToolAvailable(const std::string& tool) {
  if (tool.empty()) {
    return false;
  }
  if (tool.find('/') != std::string::npos) {
    return isExecutableFile(tool);
  }
  const std::string CMD = "command -v " + shellQuote(tool) + " >/dev/null 2>&1";
  return (std::system(CMD.c_str()) == 0);
}

void runPreflight(const CaptureConfig& cfg) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(cfg.outputDir, ec)) {
    fs::create_directories(cfg.outputDir, ec);
    if (ec || !fs::is_directory(cfg.outputDir)) {
      throw EnvironmentError("cannot create output directory " + cfg.outputDir +
                             (ec ? ": " + ec.message() : std::string{}));
    }
    logDebug("created output directory %s", cfg.outputDir.c_str());
  }

  if (!isToolAvailable(cfg.samplerPath)) {
    throw EnvironmentError("sampler not installed: '" + cfg.samplerPath +
                           "' was not found. Please install perf to use this tool.");
  }

  if (!fs::is_directory(cfg.flamegraphDir, ec)) {
    throw EnvironmentError("flamegraph toolchain missing: directory does not exist at " +
                           cfg.flamegraphDir +
                           ". Hint: run \"git clone https://github.com/brendangregg/FlameGraph.git " +
                           cfg.flamegraphDir + "\" to download it.");
  }
  for (const std::string* tool : {&cfg.collapseToolPath, &cfg.renderToolPath}) {
    if (!isExecutableFile(*tool)) {
      throw EnvironmentError("flamegraph toolchain missing: " + *tool +
                             " is not an executable file.");
    }
  }
}

} // namespace capture
} // namespace perfcap
