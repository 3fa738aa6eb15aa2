/**
 * @file ModeResolver_uTest.cpp
 * @brief Unit tests for perfcap::capture::parseCaptureFlags() and resolveSession().
 *
 * Covers every valid flag combination, the rejection order for contradictory
 * input, attached/separate option values and the long configuration flags.
 */

#include "src/capture/inc/CaptureErrors.hpp"
#include "src/capture/inc/ModeResolver.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <initializer_list>
#include <string>
#include <vector>

using perfcap::capture::ArgumentError;
using perfcap::capture::CaptureConfig;
using perfcap::capture::Mode;
using perfcap::capture::parseCaptureFlags;
using perfcap::capture::RawFlags;
using perfcap::capture::resolveSession;
using perfcap::capture::Session;

namespace {

/** @brief Helper to create argc/argv from strings. */
class ArgvBuilder {
public:
  explicit ArgvBuilder(std::initializer_list<const char*> args) {
    for (const char* arg : args) {
      storage_.emplace_back(arg);
    }
    for (auto& s : storage_) {
      argv_.push_back(const_cast<char*>(s.c_str()));
    }
    argv_.push_back(nullptr);
    argc_ = static_cast<int>(storage_.size());
  }

  int argc() const { return argc_; }
  char** argv() { return argv_.data(); }

private:
  std::vector<std::string> storage_;
  std::vector<char*> argv_;
  int argc_ = 0;
};

Session resolve(std::initializer_list<const char*> args) {
  CaptureConfig cfg;
  ArgvBuilder b(args);
  return resolveSession(parseCaptureFlags(cfg, b.argc(), b.argv()));
}

} // namespace

/* ----------------------------- Mode Mapping Tests ----------------------------- */

/** @test -P with -D maps to PidTimed. */
TEST(ModeResolverTest, PidWithDurationIsTimed) {
  const Session S = resolve({"perfcap", "-P", "1234", "-D", "5"});

  EXPECT_EQ(S.mode, Mode::PidTimed);
  ASSERT_TRUE(S.targetPid.has_value());
  EXPECT_EQ(*S.targetPid, 1234);
  ASSERT_TRUE(S.durationSec.has_value());
  EXPECT_DOUBLE_EQ(*S.durationSec, 5.0);
  EXPECT_FALSE(S.execPath.has_value());
}

/** @test -P alone maps to PidUntilInterrupt. */
TEST(ModeResolverTest, PidAloneRunsUntilInterrupt) {
  const Session S = resolve({"perfcap", "-P", "42"});

  EXPECT_EQ(S.mode, Mode::PidUntilInterrupt);
  EXPECT_EQ(*S.targetPid, 42);
  EXPECT_FALSE(S.durationSec.has_value());
}

/** @test -E alone maps to ExecRecord. */
TEST(ModeResolverTest, ExecAloneRecords) {
  const Session S = resolve({"perfcap", "-E", "/bin/true"});

  EXPECT_EQ(S.mode, Mode::ExecRecord);
  ASSERT_TRUE(S.execPath.has_value());
  EXPECT_EQ(*S.execPath, "/bin/true");
  EXPECT_TRUE(S.execArgs.empty());
  EXPECT_FALSE(S.targetPid.has_value());
}

/** @test -E with -I maps to ExecInteractive. */
TEST(ModeResolverTest, ExecWithInteractiveFlag) {
  const Session S = resolve({"perfcap", "-E", "./app", "-I"});

  EXPECT_EQ(S.mode, Mode::ExecInteractive);
}

/** @test Flag order does not matter. */
TEST(ModeResolverTest, FlagOrderIndependent) {
  EXPECT_EQ(resolve({"perfcap", "-I", "-E", "./app"}).mode, Mode::ExecInteractive);
  EXPECT_EQ(resolve({"perfcap", "-D", "3", "-P", "7"}).mode, Mode::PidTimed);
}

/** @test The -E value is split into path and arguments. */
TEST(ModeResolverTest, ExecValueCarriesArguments) {
  const Session S = resolve({"perfcap", "-E", "./server --port 8080"});

  EXPECT_EQ(*S.execPath, "./server");
  ASSERT_EQ(S.execArgs.size(), 2u);
  EXPECT_EQ(S.execArgs[0], "--port");
  EXPECT_EQ(S.execArgs[1], "8080");
}

/** @test Values may be attached to the flag, as with getopts. */
TEST(ModeResolverTest, AttachedValues) {
  const Session S = resolve({"perfcap", "-P99", "-D0.5"});

  EXPECT_EQ(S.mode, Mode::PidTimed);
  EXPECT_EQ(*S.targetPid, 99);
  EXPECT_DOUBLE_EQ(*S.durationSec, 0.5);
}

/* ----------------------------- Ignored Combinations ----------------------------- */

/** @test -D with -E is accepted and has no effect. */
TEST(ModeResolverTest, DurationIgnoredForExec) {
  const Session S = resolve({"perfcap", "-E", "./app", "-D", "10"});

  EXPECT_EQ(S.mode, Mode::ExecRecord);
  EXPECT_FALSE(S.durationSec.has_value());
}

/** @test -I with -P is accepted and has no effect. */
TEST(ModeResolverTest, InteractiveIgnoredForPid) {
  EXPECT_EQ(resolve({"perfcap", "-P", "5", "-I"}).mode, Mode::PidUntilInterrupt);
  EXPECT_EQ(resolve({"perfcap", "-P", "5", "-I", "-D", "2"}).mode, Mode::PidTimed);
}

/* ----------------------------- Rejection Tests ----------------------------- */

/** @test -P and -E together are rejected. */
TEST(ModeResolverTest, PidAndExecMutuallyExclusive) {
  try {
    resolve({"perfcap", "-P", "1", "-E", "/bin/true"});
    FAIL() << "expected ArgumentError";
  } catch (const ArgumentError& e) {
    EXPECT_NE(std::string(e.what()).find("mutually exclusive"), std::string::npos);
  }
}

/** @test Exclusivity is checked before value syntax. */
TEST(ModeResolverTest, ExclusivityCheckedFirst) {
  try {
    resolve({"perfcap", "-P", "not-a-pid", "-E", "/bin/true"});
    FAIL() << "expected ArgumentError";
  } catch (const ArgumentError& e) {
    EXPECT_NE(std::string(e.what()).find("mutually exclusive"), std::string::npos);
  }
}

/** @test Missing target is rejected. */
TEST(ModeResolverTest, NoTargetRejected) {
  try {
    resolve({"perfcap", "-D", "5"});
    FAIL() << "expected ArgumentError";
  } catch (const ArgumentError& e) {
    EXPECT_NE(std::string(e.what()).find("no target specified"), std::string::npos);
  }
  EXPECT_THROW(resolve({"perfcap"}), ArgumentError);
}

/** @test Malformed PIDs are rejected. */
TEST(ModeResolverTest, InvalidPidRejected) {
  EXPECT_THROW(resolve({"perfcap", "-P", "abc"}), ArgumentError);
  EXPECT_THROW(resolve({"perfcap", "-P", "0"}), ArgumentError);
  EXPECT_THROW(resolve({"perfcap", "-P", "-5"}), ArgumentError);
  EXPECT_THROW(resolve({"perfcap", "-P", "12x"}), ArgumentError);
}

/** @test Malformed or non-positive durations are rejected. */
TEST(ModeResolverTest, InvalidDurationRejected) {
  EXPECT_THROW(resolve({"perfcap", "-P", "1", "-D", "soon"}), ArgumentError);
  EXPECT_THROW(resolve({"perfcap", "-P", "1", "-D", "0"}), ArgumentError);
}

/** @test Unknown options and missing values fail with the usage line. */
TEST(ModeResolverTest, UnknownOptionAndMissingValue) {
  try {
    resolve({"perfcap", "-X"});
    FAIL() << "expected ArgumentError";
  } catch (const ArgumentError& e) {
    EXPECT_NE(std::string(e.what()).find("Usage:"), std::string::npos);
  }
  EXPECT_THROW(resolve({"perfcap", "-P"}), ArgumentError);
  EXPECT_THROW(resolve({"perfcap", "-E", "./app", "stray"}), ArgumentError);
}

/** @test Empty -E value is rejected. */
TEST(ModeResolverTest, EmptyExecRejected) {
  EXPECT_THROW(resolve({"perfcap", "-E", "   "}), ArgumentError);
}

/* ----------------------------- Config Flag Tests ----------------------------- */

/** @test Long flags land in the config, not in RawFlags. */
TEST(ModeResolverTest, LongFlagsConfigure) {
  CaptureConfig cfg;
  ArgvBuilder b{"perfcap",          "--output-dir", "/tmp/pc", "--flamegraph-dir",
                "/srv/FlameGraph", "--sampler",    "/usr/bin/perf", "--frequency",
                "997",              "--verbose",    "-P",      "10"};

  const RawFlags FLAGS = parseCaptureFlags(cfg, b.argc(), b.argv());

  EXPECT_EQ(cfg.outputDir, "/tmp/pc");
  EXPECT_EQ(cfg.flamegraphDir, "/srv/FlameGraph");
  EXPECT_EQ(cfg.samplerPath, "/usr/bin/perf");
  EXPECT_EQ(cfg.captureFrequency, 997);
  EXPECT_TRUE(cfg.verbose);
  ASSERT_TRUE(FLAGS.pid.has_value());
  EXPECT_EQ(*FLAGS.pid, "10");
}

/** @test Bad frequency is rejected. */
TEST(ModeResolverTest, InvalidFrequencyRejected) {
  CaptureConfig cfg;
  ArgvBuilder b{"perfcap", "--frequency", "0", "-P", "1"};

  EXPECT_THROW(parseCaptureFlags(cfg, b.argc(), b.argv()), ArgumentError);
}

/** @test --help and -h set the help flag. */
TEST(ModeResolverTest, HelpFlag) {
  CaptureConfig cfg;
  ArgvBuilder a{"perfcap", "--help"};
  ArgvBuilder b{"perfcap", "-h"};

  EXPECT_TRUE(parseCaptureFlags(cfg, a.argc(), a.argv()).help);
  EXPECT_TRUE(parseCaptureFlags(cfg, b.argc(), b.argv()).help);
}

/** @test --ack-signal selects the acknowledge signal and rejects unknown names. */
TEST(ModeResolverTest, AckSignalFlag) {
  CaptureConfig cfg;
  ArgvBuilder ok{"perfcap", "--ack-signal", "USR1", "-E", "./app", "-I"};
  ArgvBuilder bad{"perfcap", "--ack-signal", "TERMINATE", "-E", "./app", "-I"};

  parseCaptureFlags(cfg, ok.argc(), ok.argv());
  EXPECT_EQ(cfg.ackSignal, SIGUSR1);
  EXPECT_THROW(parseCaptureFlags(cfg, bad.argc(), bad.argv()), ArgumentError);
}
