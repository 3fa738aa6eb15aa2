/**
 * @file CaptureApp_pTest.cpp
 * @brief End-to-end tests of runCapture() exit codes and outputs.
 */

#include "src/capture/inc/CaptureApp.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

using perfcap::capture::runCapture;
using perfcap::capture::test::ArgvBuilder;
using perfcap::capture::test::deadPid;
using perfcap::capture::test::FakeToolchain;

namespace {

/** @brief Invoke runCapture with the fake toolchain wired in via long flags. */
int runWithFakes(const FakeToolchain& fake, std::vector<std::string> args) {
  std::vector<std::string> full{"perfcap", "--sampler", fake.samplerPath(), "--flamegraph-dir",
                                fake.dir(), "--output-dir", fake.outputDir()};
  full.insert(full.end(), args.begin(), args.end());
  ArgvBuilder b{full};
  return runCapture(b.argc(), b.argv());
}

} // namespace

/* ----------------------------- Success Tests ----------------------------- */

/** @test Executable recording exits 0 and leaves the three artifacts. */
TEST(CaptureAppTest, ExecRecordEndToEnd) {
  FakeToolchain fake;

  EXPECT_EQ(runWithFakes(fake, {"-E", "/bin/true"}), 0);

  EXPECT_EQ(fake.listOutput(".perf").size(), 1u);
  EXPECT_EQ(fake.listOutput(".folded").size(), 1u);
  const auto SVGS = fake.listOutput(".svg");
  ASSERT_EQ(SVGS.size(), 1u);
  EXPECT_EQ(SVGS[0].rfind("exec_", 0), 0u);
}

/** @test Timed PID recording exits 0 and names the image pid_*. */
TEST(CaptureAppTest, PidTimedEndToEnd) {
  FakeToolchain fake;

  EXPECT_EQ(runWithFakes(fake, {"-P", std::to_string(::getpid()), "-D", "0.1"}), 0);

  const auto SVGS = fake.listOutput(".svg");
  ASSERT_EQ(SVGS.size(), 1u);
  EXPECT_EQ(SVGS[0].rfind("pid_", 0), 0u);
}

/** @test A missing output directory is created before recording. */
TEST(CaptureAppTest, CreatesOutputDirectory) {
  FakeToolchain fake;
  const std::string OUT = fake.dir() + "/fresh/perf_log";
  std::vector<std::string> args{"perfcap", "--sampler", fake.samplerPath(), "--flamegraph-dir",
                                fake.dir(), "--output-dir", OUT, "-E", "/bin/true"};
  ArgvBuilder b{args};

  EXPECT_EQ(runCapture(b.argc(), b.argv()), 0);
  EXPECT_TRUE(std::filesystem::is_directory(OUT));
}

/** @test --help prints usage and exits 0 without touching the toolchain. */
TEST(CaptureAppTest, HelpExitsZero) {
  const std::vector<std::string> ARGS{"perfcap", "--help", "--sampler", "/nonexistent/perf"};
  ArgvBuilder b{ARGS};

  EXPECT_EQ(runCapture(b.argc(), b.argv()), 0);
}

/* ----------------------------- Failure Tests ----------------------------- */

/** @test Contradictory flags exit 1 and start nothing. */
TEST(CaptureAppTest, ConflictingTargetsExitOne) {
  FakeToolchain fake;

  EXPECT_EQ(runWithFakes(fake, {"-P", "1", "-E", "/bin/true"}), 1);
  EXPECT_TRUE(fake.perfCalls().empty());
}

/** @test No target at all exits 1. */
TEST(CaptureAppTest, NoTargetExitsOne) {
  FakeToolchain fake;

  EXPECT_EQ(runWithFakes(fake, {}), 1);
}

/** @test A PID that is gone exits 1 with no flamegraph. */
TEST(CaptureAppTest, DeadPidExitsOne) {
  FakeToolchain fake;

  EXPECT_EQ(runWithFakes(fake, {"-P", std::to_string(deadPid()), "-D", "1"}), 1);
  EXPECT_TRUE(fake.listOutput(".svg").empty());
}

/** @test Missing sampler exits 1 before any subprocess runs. */
TEST(CaptureAppTest, MissingSamplerExitsOne) {
  FakeToolchain fake;
  std::vector<std::string> args{"perfcap", "--sampler", fake.dir() + "/no-perf",
                                "--flamegraph-dir", fake.dir(), "--output-dir",
                                fake.outputDir(), "-E", "/bin/true"};
  ArgvBuilder b{args};

  EXPECT_EQ(runCapture(b.argc(), b.argv()), 1);
  EXPECT_TRUE(fake.listOutput(".svg").empty());
}

/** @test Missing FlameGraph checkout exits 1 even though recording could work. */
TEST(CaptureAppTest, MissingFlamegraphExitsOne) {
  FakeToolchain fake;
  std::vector<std::string> args{"perfcap", "--sampler", fake.samplerPath(),
                                "--flamegraph-dir", fake.dir() + "/FlameGraph", "--output-dir",
                                fake.outputDir(), "-E", "/bin/true"};
  ArgvBuilder b{args};

  EXPECT_EQ(runCapture(b.argc(), b.argv()), 1);
  EXPECT_TRUE(fake.perfCalls().empty());
}

/** @test A pipeline failure exits 1 and leaves no partial artifacts. */
TEST(CaptureAppTest, PipelineFailureExitsOne) {
  perfcap::capture::test::FakeOptions opts;
  opts.failingCollapse = true;
  FakeToolchain fake(opts);

  EXPECT_EQ(runWithFakes(fake, {"-E", "/bin/true"}), 1);
  EXPECT_TRUE(fake.listOutput(".perf").empty());
  EXPECT_TRUE(fake.listOutput(".svg").empty());
}
