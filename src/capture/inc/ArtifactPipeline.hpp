#ifndef PERFCAP_ARTIFACTPIPELINE_HPP
#define PERFCAP_ARTIFACTPIPELINE_HPP
/**
 * @file ArtifactPipeline.hpp
 * @brief raw perf samples -> per-event script -> folded stacks -> SVG flamegraph.
 *
 * Stages (each runs as a subprocess with stdout redirected to its artifact):
 *  1. conversion: `<sampler> script -i <raw>`          -> out_<ts>.perf
 *  2. collapse:   `<collapseTool> out_<ts>.perf`       -> out_<ts>.folded
 *  3. render:     `<renderTool> out_<ts>.folded`       -> <mode>_<ts>.svg
 *
 * A stage fails on spawn failure, non-zero exit, or empty output. Later stages
 * never run after a failure, and every artifact of the run is removed before
 * PipelineError propagates. There are no timeouts: a hung tool hangs the run.
 */

#include <ctime>
#include <string>
#include <vector>

#include "src/capture/inc/CaptureConfig.hpp"
#include "src/capture/inc/CaptureErrors.hpp"

namespace perfcap {
namespace capture {

/* ----------------------------- ArtifactSet ----------------------------- */

/** @brief The three files of one pipeline run, sharing one timestamp token. */
struct ArtifactSet {
  std::string timestamp;
  std::string perfScript; ///< <dir>/out_<ts>.perf
  std::string folded;     ///< <dir>/out_<ts>.folded
  std::string image;      ///< <dir>/<mode>_<ts>.svg

  /** @brief Derive the file names from {dir, mode tag, token} alone. */
  static ArtifactSet forToken(const std::string& outputDir, const std::string& modeTag,
                              const std::string& timestamp);
};

/** @return local time formatted as YYYYmmddHHMMSS. */
std::string formatTimestamp(std::time_t t);

/**
 * @brief Pick a token based on `base` that no existing artifact in outputDir uses.
 * @return base itself, or base_1, base_2, ... on collision.
 */
std::string uniqueToken(const std::string& outputDir, const std::string& modeTag,
                        const std::string& base);

/* ---------------------------- ArtifactPipeline ---------------------------- */

class ArtifactPipeline {
public:
  explicit ArtifactPipeline(CaptureConfig cfg);

  /**
   * @brief Run all three stages with a fresh timestamp token.
   * @throws PipelineError naming the first failed stage.
   */
  ArtifactSet run(const std::string& rawDataPath, const std::string& modeTag) const;

  /** @brief Same, with a caller-chosen base token (made unique in the output directory). */
  ArtifactSet run(const std::string& rawDataPath, const std::string& modeTag,
                  const std::string& baseToken) const;

private:
  void runStage(PipelineStage stage, const std::vector<std::string>& argv,
                const std::string& outPath) const;

  CaptureConfig cfg_;
};

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_ARTIFACTPIPELINE_HPP
