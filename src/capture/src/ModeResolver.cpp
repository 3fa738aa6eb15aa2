/**
 * @file ModeResolver.cpp
 * @brief Flag parsing and mode resolution.
 */

#include "src/capture/inc/ModeResolver.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#include "src/capture/inc/CaptureErrors.hpp"
#include "src/capture/inc/CaptureLog.hpp"

namespace perfcap {
namespace capture {

/* ----------------------------- Helpers ----------------------------- */

namespace {

std::optional<long> parseWholeLong(const std::string& s) {
  if (s.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return v;
}

std::optional<double> parseWholeDouble(const std::string& s) {
  if (s.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
    return std::nullopt;
  }
  return v;
}

std::vector<std::string> splitWords(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string word;
  while (in >> word) {
    out.push_back(std::move(word));
  }
  return out;
}

} // namespace

/* --------------------------------- API --------------------------------- */

std::string usageLine(const std::string& prog) {
  return "Usage: " + prog + " -P <pid> [-D <duration>] | -E <exec_file_path> [-I]";
}

std::string helpText(const std::string& prog) {
  return usageLine(prog) +
         "\n"
         "\n"
         "  -P <pid>              record an existing process\n"
         "  -D <seconds>          stop recording after <seconds> (with -P)\n"
         "  -E <path>             launch <path> under the sampler and record it\n"
         "  -I                    interactive counter mode (with -E): the target sends\n"
         "                        SIGUSR1 to start and SIGUSR2 to stop perf stat\n"
         "\n"
         "  --output-dir PATH     artifact directory (default ./perf_log)\n"
         "  --flamegraph-dir PATH FlameGraph checkout (default /opt/FlameGraph)\n"
         "  --sampler PATH        perf binary (default: perf on PATH)\n"
         "  --frequency N         sampling frequency in Hz (default 499)\n"
         "  --ack-signal SIG      signal acknowledging -I collection (default RTMIN)\n"
         "  --verbose             debug output\n"
         "  -h, --help            show this help\n";
}

RawFlags parseCaptureFlags(CaptureConfig& cfg, int argc, char** argv) {
  const std::string PROG = (argc > 0 && argv[0] != nullptr) ? argv[0] : "perfcap";
  RawFlags flags;

  // Value of a flag: attached ("-P123") or the next argv entry.
  const auto NEED_ARG = [&](std::string_view opt, std::string_view attached,
                            int& i) -> std::string {
    if (!attached.empty()) {
      return std::string(attached);
    }
    if (i + 1 >= argc) {
      throw ArgumentError("Option " + std::string(opt) + " requires an argument. " +
                          usageLine(PROG));
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") {
      flags.help = true;
    } else if (a == "--verbose") {
      cfg.verbose = true;
    } else if (a == "--output-dir") {
      cfg.outputDir = NEED_ARG(a, {}, i);
    } else if (a == "--flamegraph-dir") {
      cfg.flamegraphDir = NEED_ARG(a, {}, i);
    } else if (a == "--sampler") {
      cfg.samplerPath = NEED_ARG(a, {}, i);
    } else if (a == "--frequency") {
      const std::string V = NEED_ARG(a, {}, i);
      auto hz = parseWholeLong(V);
      if (!hz || *hz <= 0 || *hz > INT_MAX) {
        throw ArgumentError("Invalid sampling frequency '" + V + "'.");
      }
      cfg.captureFrequency = static_cast<int>(*hz);
    } else if (a == "--ack-signal") {
      const std::string V = NEED_ARG(a, {}, i);
      const int SIG = parseSignalSpec(V);
      if (SIG == 0) {
        throw ArgumentError("Invalid acknowledge signal '" + V + "'.");
      }
      cfg.ackSignal = SIG;
    } else if (a.size() >= 2 && a[0] == '-' && a[1] != '-') {
      const char OPT = a[1];
      const std::string_view ATTACHED = a.substr(2);
      switch (OPT) {
      case 'P':
        flags.pid = NEED_ARG("-P", ATTACHED, i);
        break;
      case 'D':
        flags.duration = NEED_ARG("-D", ATTACHED, i);
        break;
      case 'E':
        flags.exec = NEED_ARG("-E", ATTACHED, i);
        break;
      case 'I':
        if (!ATTACHED.empty()) {
          throw ArgumentError("Invalid option: " + std::string(a) + ". " + usageLine(PROG));
        }
        flags.interactive = true;
        break;
      default:
        throw ArgumentError("Invalid option: " + std::string(a) + ". " + usageLine(PROG));
      }
    } else {
      throw ArgumentError("Unexpected argument: " + std::string(a) + ". " + usageLine(PROG));
    }
  }

  return flags;
}

Session resolveSession(const RawFlags& flags) {
  if (flags.pid && flags.exec) {
    throw ArgumentError("-P and -E options are mutually exclusive targets.");
  }
  if (!flags.pid && !flags.exec) {
    throw ArgumentError("no target specified. Use -P for PID or -E for executable file path.");
  }

  Session s;

  if (flags.pid) {
    auto pid = parseWholeLong(*flags.pid);
    if (!pid || *pid <= 0 || *pid > INT_MAX) {
      throw ArgumentError("Invalid PID '" + *flags.pid + "'.");
    }
    s.targetPid = static_cast<pid_t>(*pid);

    if (flags.interactive) {
      logWarn("-I only applies to -E; ignoring it for PID %ld.", *pid);
    }

    if (flags.duration) {
      auto secs = parseWholeDouble(*flags.duration);
      if (!secs || *secs <= 0.0) {
        throw ArgumentError("Invalid duration '" + *flags.duration + "'.");
      }
      s.durationSec = *secs;
      s.mode = Mode::PidTimed;
    } else {
      s.mode = Mode::PidUntilInterrupt;
    }
    return s;
  }

  // Executable target. The -E value may carry arguments ("./app --fast").
  auto words = splitWords(*flags.exec);
  if (words.empty()) {
    throw ArgumentError("Empty executable path.");
  }
  s.execPath = words.front();
  s.execArgs.assign(words.begin() + 1, words.end());

  if (flags.duration) {
    logWarn("-D has no effect with -E; the executable is recorded until it exits.");
  }
  s.mode = flags.interactive ? Mode::ExecInteractive : Mode::ExecRecord;
  return s;
}

} // namespace capture
} // namespace perfcap
