/**
 * @file TestHelpers.hpp
 * @brief Shared utilities for capture process tests
 *
 * Provides a throwaway directory holding shell stand-ins for perf and the
 * FlameGraph scripts, so the controller and pipeline can be driven end to end
 * without perf_event access or a Perl toolchain.
 *
 * Fake tool behavior:
 *  - perf record: logs its argv to perf.calls, writes "raw-samples" to -o.
 *    With a workload after `--` it runs it and exits with its status. Without
 *    one it loops until SIGINT/SIGTERM and then exits 0. `-p` with a dead PID
 *    exits 255, like a failed attach. FakeOptions can make it exit by itself,
 *    lose its data on stop, or interrupt the controller.
 *  - perf stat: loops until SIGINT/SIGTERM and then exits 0.
 *  - perf script -i F: prints one sample, or exits 1 if F is missing or empty.
 *  - stackcollapse-perf.pl: cat of its input.
 *  - flamegraph.pl: prints "<svg/>".
 */

#ifndef PERFCAP_TEST_HELPERS_HPP
#define PERFCAP_TEST_HELPERS_HPP

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "src/capture/inc/CaptureConfig.hpp"

namespace perfcap {
namespace capture {
namespace test {

/* ----------------------------- File Helpers ----------------------------- */

/** @return whole file content, or "" if unreadable. */
inline std::string readFile(const std::string& path) {
  std::ifstream ifs(path);
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

/**
 * @brief PID of a process that has already exited and been reaped.
 *
 * Safer than a hard-coded large PID, which could belong to a live process.
 */
inline pid_t deadPid() {
  pid_t child = ::fork();
  if (child == 0) {
    ::_exit(0);
  }
  int status = 0;
  ::waitpid(child, &status, 0);
  return child;
}

/* ----------------------------- ArgvBuilder ----------------------------- */

/** @brief Helper to create argc/argv from strings. */
class ArgvBuilder {
public:
  explicit ArgvBuilder(const std::vector<std::string>& args) : storage_(args) {
    for (auto& s : storage_) {
      argv_.push_back(s.data());
    }
    argv_.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage_.size()); }
  char** argv() { return argv_.data(); }

private:
  std::vector<std::string> storage_;
  std::vector<char*> argv_;
};

/* ---------------------------- FakeToolchain ---------------------------- */

struct FakeOptions {
  bool selfInterrupt = false;    ///< perf record sends interruptWith to its parent twice
  std::string interruptWith = "INT";
  int recordExitsWith = -1;      ///< >= 0: unbounded perf record exits with this by itself
  bool loseDataOnStop = false;   ///< perf record deletes its output and exits 1 when stopped
  bool failingRecord = false;    ///< perf record exits 255 without writing data
  bool failingCollapse = false; ///< stackcollapse-perf.pl exits 3
  bool emptyRender = false;     ///< flamegraph.pl exits 0 with no output
};

class FakeToolchain {
public:
  explicit FakeToolchain(FakeOptions opts = {}) {
    char tmpl[] = "/tmp/perfcap_test_XXXXXX";
    const char* made = ::mkdtemp(tmpl);
    dir_ = (made != nullptr) ? made : "/tmp/perfcap_test_fallback";
    std::filesystem::create_directories(outputDir());

    writeScript("perf", perfScript(opts));
    writeScript("stackcollapse-perf.pl", opts.failingCollapse
                                             ? "#!/bin/sh\necho 'collapse broke' >&2\nexit 3\n"
                                             : "#!/bin/sh\ncat \"$1\"\n");
    writeScript("flamegraph.pl", opts.emptyRender
                                     ? "#!/bin/sh\nexit 0\n"
                                     : "#!/bin/sh\n[ -s \"$1\" ] || exit 1\necho '<svg/>'\n");
  }

  ~FakeToolchain() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  FakeToolchain(const FakeToolchain&) = delete;
  FakeToolchain& operator=(const FakeToolchain&) = delete;

  const std::string& dir() const { return dir_; }
  std::string outputDir() const { return dir_ + "/out"; }
  std::string samplerPath() const { return dir_ + "/perf"; }

  /** @brief Config pointing at the fake tools, with no handshake delay. */
  CaptureConfig config() const {
    CaptureConfig cfg;
    cfg.samplerPath = samplerPath();
    cfg.flamegraphDir = dir_;
    cfg.outputDir = outputDir();
    cfg.handshakeGraceMs = 0;
    resolveToolchainPaths(cfg);
    return cfg;
  }

  /** @brief Write an executable file under dir(). @return its path. */
  std::string writeScript(const std::string& name, const std::string& body) const {
    const std::string PATH = dir_ + "/" + name;
    {
      std::ofstream ofs(PATH, std::ios::trunc);
      ofs << body;
    }
    std::filesystem::permissions(PATH, std::filesystem::perms::owner_all |
                                           std::filesystem::perms::group_read |
                                           std::filesystem::perms::group_exec);
    return PATH;
  }

  /** @return one entry per fake perf invocation, in call order. */
  std::vector<std::string> perfCalls() const {
    std::vector<std::string> calls;
    std::ifstream ifs(dir_ + "/perf.calls");
    for (std::string line; std::getline(ifs, line);) {
      calls.push_back(line);
    }
    return calls;
  }

  /** @return sorted file names in outputDir() ending with suffix. */
  std::vector<std::string> listOutput(const std::string& suffix) const {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(outputDir(), ec)) {
      const std::string NAME = entry.path().filename().string();
      if (NAME.size() >= suffix.size() &&
          NAME.compare(NAME.size() - suffix.size(), suffix.size(), suffix) == 0) {
        names.push_back(NAME);
      }
    }
    std::sort(names.begin(), names.end());
    return names;
  }

private:
  std::string perfScript(const FakeOptions& opts) const {
    std::string s = "#!/bin/sh\n"
                    "echo \"$*\" >> '" +
                    dir_ + "/perf.calls'\n" +
                    "cmd=\"$1\"\n"
                    "shift\n"
                    "case \"$cmd\" in\n"
                    "record)\n"
                    "  out=perf.data\n"
                    "  pid=\n"
                    "  while [ $# -gt 0 ]; do\n"
                    "    case \"$1\" in\n"
                    "      -o) out=\"$2\"; shift 2 ;;\n"
                    "      -p) pid=\"$2\"; shift 2 ;;\n"
                    "      -F) shift 2 ;;\n"
                    "      --) shift; break ;;\n"
                    "      *) shift ;;\n"
                    "    esac\n"
                    "  done\n";
    if (opts.failingRecord) {
      s += "  echo 'fake perf: record failed' >&2\n"
           "  exit 255\n";
    }
    s += "  if [ -n \"$pid\" ] && ! kill -0 \"$pid\" 2>/dev/null; then\n"
         "    echo \"fake perf: cannot attach to $pid\" >&2\n"
         "    exit 255\n"
         "  fi\n"
         "  if [ $# -gt 0 ]; then\n"
         "    \"$@\"\n"
         "    rc=$?\n"
         "    echo raw-samples > \"$out\"\n"
         "    exit $rc\n"
         "  fi\n"
         "  echo raw-samples > \"$out\"\n";
    if (opts.recordExitsWith >= 0) {
      s += "  sleep 0.1\n"
           "  exit " +
           std::to_string(opts.recordExitsWith) + "\n";
    }
    s += opts.loseDataOnStop ? "  trap 'rm -f \"$out\"; exit 1' INT TERM\n"
                             : "  trap 'exit 0' INT TERM\n";
    if (opts.selfInterrupt) {
      s += "  kill -" + opts.interruptWith + " $PPID\n" + "  kill -" + opts.interruptWith +
           " $PPID\n";
    }
    s += "  while :; do sleep 0.05; done\n"
         "  ;;\n"
         "stat)\n"
         "  trap 'echo \" Performance counter stats\" >&2; exit 0' INT TERM\n"
         "  while :; do sleep 0.05; done\n"
         "  ;;\n"
         "script)\n"
         "  [ \"$1\" = -i ] && [ -s \"$2\" ] || exit 1\n"
         "  printf 'app 4242 [000] 1.000: 1 cycles:\\n\\tmain\\n\\twork\\n\\n'\n"
         "  ;;\n"
         "*)\n"
         "  exit 2\n"
         "  ;;\n"
         "esac\n";
    return s;
  }

  std::string dir_;
};

/** @return true if any line of calls starts with prefix. */
inline bool anyCallStartsWith(const std::vector<std::string>& calls, const std::string& prefix) {
  return std::any_of(calls.begin(), calls.end(),
                     [&](const std::string& c) { return c.rfind(prefix, 0) == 0; });
}

} // namespace test
} // namespace capture
} // namespace perfcap

#endif // PERFCAP_TEST_HELPERS_HPP
