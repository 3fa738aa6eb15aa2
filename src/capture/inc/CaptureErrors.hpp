#ifndef PERFCAP_CAPTUREERRORS_HPP
#define PERFCAP_CAPTUREERRORS_HPP
/**
 * @file CaptureErrors.hpp
 * @brief Error taxonomy for the capture controller.
 *
 * Every error is terminal for the session. The entry point catches CaptureError,
 * prints the message and exits with status 1.
 */

#include <stdexcept>
#include <string>

namespace perfcap {
namespace capture {

/* ----------------------------- CaptureError ----------------------------- */

class CaptureError : public std::runtime_error {
public:
  explicit CaptureError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Missing tool or directory, detected by preflight. */
class EnvironmentError : public CaptureError {
public:
  explicit EnvironmentError(const std::string& message) : CaptureError(message) {}
};

/** @brief Invalid or contradictory command-line flags. */
class ArgumentError : public CaptureError {
public:
  explicit ArgumentError(const std::string& message) : CaptureError(message) {}
};

/** @brief A subprocess failed to start, attach, or exited abnormally before a stop request. */
class SpawnError : public CaptureError {
public:
  explicit SpawnError(const std::string& message) : CaptureError(message) {}
};

/* ----------------------------- PipelineError ----------------------------- */

enum class PipelineStage { Conversion, Collapse, Render };

inline const char* pipelineStageName(PipelineStage stage) noexcept {
  switch (stage) {
  case PipelineStage::Conversion:
    return "conversion";
  case PipelineStage::Collapse:
    return "collapse";
  case PipelineStage::Render:
    return "render";
  }
  return "unknown";
}

/** @brief One of the artifact stages failed; carries the failing stage. */
class PipelineError : public CaptureError {
public:
  PipelineError(PipelineStage stage, const std::string& detail)
      : CaptureError(std::string(pipelineStageName(stage)) + " failed: " + detail),
        stage_(stage) {}

  PipelineStage stage() const noexcept { return stage_; }

private:
  PipelineStage stage_;
};

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_CAPTUREERRORS_HPP
