/**
 * @file Session.cpp
 * @brief Mode naming helpers.
 */

#include "src/capture/inc/Session.hpp"

namespace perfcap {
namespace capture {

const char* modeName(Mode mode) noexcept {
  switch (mode) {
  case Mode::PidTimed:
    return "pid-timed";
  case Mode::PidUntilInterrupt:
    return "pid-until-interrupt";
  case Mode::ExecRecord:
    return "exec-record";
  case Mode::ExecInteractive:
    return "exec-interactive";
  }
  return "unknown";
}

const char* modeTag(Mode mode) noexcept {
  switch (mode) {
  case Mode::PidTimed:
  case Mode::PidUntilInterrupt:
    return "pid";
  case Mode::ExecRecord:
  case Mode::ExecInteractive:
    return "exec";
  }
  return "unknown";
}

bool producesArtifacts(Mode mode) noexcept { return mode != Mode::ExecInteractive; }

} // namespace capture
} // namespace perfcap
