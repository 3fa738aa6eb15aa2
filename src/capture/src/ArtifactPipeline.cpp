/**
 * @file ArtifactPipeline.cpp
 * @brief Conversion, collapse and render stages.
 */

#include "src/capture/inc/ArtifactPipeline.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <utility>

#include "src/capture/inc/CaptureLog.hpp"
#include "src/capture/inc/Subprocess.hpp"

namespace perfcap {
namespace capture {

/* ----------------------------- Helpers ----------------------------- */

namespace {

bool anyExists(const ArtifactSet& set) {
  std::error_code ec;
  for (const std::string* p : {&set.perfScript, &set.folded, &set.image}) {
    if (std::filesystem::exists(*p, ec)) {
      return true;
    }
  }
  return false;
}

void removeArtifacts(const ArtifactSet& set) noexcept {
  std::error_code ec;
  for (const std::string* p : {&set.perfScript, &set.folded, &set.image}) {
    std::filesystem::remove(*p, ec);
  }
}

} // namespace

/* ----------------------------- ArtifactSet ----------------------------- */

ArtifactSet ArtifactSet::forToken(const std::string& outputDir, const std::string& modeTag,
                                  const std::string& timestamp) {
  ArtifactSet set;
  set.timestamp = timestamp;
  set.perfScript = outputDir + "/out_" + timestamp + ".perf";
  set.folded = outputDir + "/out_" + timestamp + ".folded";
  set.image = outputDir + "/" + modeTag + "_" + timestamp + ".svg";
  return set;
}

std::string formatTimestamp(std::time_t t) {
  std::tm tm{};
  ::localtime_r(&t, &tm);
  std::array<char, 32> buf{};
  std::size_t n = std::strftime(buf.data(), buf.size(), "%Y%m%d%H%M%S", &tm);
  return std::string(buf.data(), n);
}

std::string uniqueToken(const std::string& outputDir, const std::string& modeTag,
                        const std::string& base) {
  std::string token = base;
  for (int n = 1; anyExists(ArtifactSet::forToken(outputDir, modeTag, token)); ++n) {
    token = base + "_" + std::to_string(n);
  }
  return token;
}

/* ---------------------------- ArtifactPipeline ---------------------------- */

ArtifactPipeline::ArtifactPipeline(CaptureConfig cfg) : cfg_(std::move(cfg)) {
  resolveToolchainPaths(cfg_);
}

ArtifactSet ArtifactPipeline::run(const std::string& rawDataPath,
                                  const std::string& modeTag) const {
  return run(rawDataPath, modeTag, formatTimestamp(std::time(nullptr)));
}

ArtifactSet ArtifactPipeline::run(const std::string& rawDataPath, const std::string& modeTag,
                                  const std::string& baseToken) const {
  const ArtifactSet SET =
      ArtifactSet::forToken(cfg_.outputDir, modeTag, uniqueToken(cfg_.outputDir, modeTag, baseToken));

  try {
    std::error_code ec;
    if (!std::filesystem::exists(rawDataPath, ec)) {
      throw PipelineError(PipelineStage::Conversion, "raw sample file " + rawDataPath +
                                                         " does not exist");
    }

    logInfo("Converting performance data to readable format...");
    runStage(PipelineStage::Conversion, {cfg_.samplerPath, "script", "-i", rawDataPath},
             SET.perfScript);

    logInfo("Collapsing performance data...");
    runStage(PipelineStage::Collapse, {cfg_.collapseToolPath, SET.perfScript}, SET.folded);

    logInfo("Generating flamegraph...");
    runStage(PipelineStage::Render, {cfg_.renderToolPath, SET.folded}, SET.image);
  } catch (const PipelineError&) {
    removeArtifacts(SET);
    throw;
  }

  return SET;
}

void ArtifactPipeline::runStage(PipelineStage stage, const std::vector<std::string>& argv,
                                const std::string& outPath) const {
  SpawnOptions opts;
  opts.stdoutPath = outPath;

  int status = 0;
  try {
    Subprocess proc = Subprocess::spawn(argv, opts);
    status = proc.wait();
  } catch (const SpawnError& e) {
    throw PipelineError(stage, e.what());
  }

  if (!exitedSuccessfully(status)) {
    throw PipelineError(stage, argv.front() + " " + describeStatus(status));
  }

  std::error_code ec;
  const auto SIZE = std::filesystem::file_size(outPath, ec);
  if (ec || SIZE == 0) {
    throw PipelineError(stage, argv.front() + " produced no output in " + outPath);
  }
  logDebug("%s stage wrote %ju bytes to %s", pipelineStageName(stage),
           static_cast<std::uintmax_t>(SIZE), outPath.c_str());
}

} // namespace capture
} // namespace perfcap
