/**
 * @file ArtifactNaming_uTest.cpp
 * @brief Unit tests for artifact file naming and timestamp tokens.
 *
 * Tests ArtifactSet::forToken(), formatTimestamp(), uniqueToken() and the
 * PipelineError message format.
 */

#include "src/capture/inc/ArtifactPipeline.hpp"
#include "src/capture/inc/CaptureErrors.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using perfcap::capture::ArtifactSet;
using perfcap::capture::formatTimestamp;
using perfcap::capture::PipelineError;
using perfcap::capture::PipelineStage;
using perfcap::capture::pipelineStageName;
using perfcap::capture::uniqueToken;

namespace {

/** @brief Temporary directory removed on scope exit. */
class ScratchDir {
public:
  ScratchDir() {
    char tmpl[] = "/tmp/perfcap_naming_XXXXXX";
    const char* made = ::mkdtemp(tmpl);
    path_ = (made != nullptr) ? made : "/tmp/perfcap_naming_fallback";
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::string& path() const { return path_; }

  void touch(const std::string& name) const { std::ofstream(path_ + "/" + name) << "x"; }

private:
  std::string path_;
};

} // namespace

/* ----------------------------- ArtifactSet Tests ----------------------------- */

/** @test File names share one token; the image carries the mode tag. */
TEST(ArtifactNamingTest, ForTokenLayout) {
  const ArtifactSet SET = ArtifactSet::forToken("./perf_log", "pid", "20240101120000");

  EXPECT_EQ(SET.timestamp, "20240101120000");
  EXPECT_EQ(SET.perfScript, "./perf_log/out_20240101120000.perf");
  EXPECT_EQ(SET.folded, "./perf_log/out_20240101120000.folded");
  EXPECT_EQ(SET.image, "./perf_log/pid_20240101120000.svg");
}

/** @test Exec mode uses its own image prefix. */
TEST(ArtifactNamingTest, ExecTag) {
  const ArtifactSet SET = ArtifactSet::forToken("/tmp/x", "exec", "20231231235959");

  EXPECT_EQ(SET.image, "/tmp/x/exec_20231231235959.svg");
}

/* ----------------------------- Timestamp Tests ----------------------------- */

/** @test Local time is rendered as 14 digits YYYYmmddHHMMSS. */
TEST(ArtifactNamingTest, TimestampFormat) {
  std::tm tm{};
  tm.tm_year = 2024 - 1900;
  tm.tm_mon = 2;
  tm.tm_mday = 7;
  tm.tm_hour = 9;
  tm.tm_min = 5;
  tm.tm_sec = 3;
  tm.tm_isdst = -1;
  const std::time_t T = std::mktime(&tm);

  EXPECT_EQ(formatTimestamp(T), "20240307090503");
}

/** @test Current time always yields 14 digits. */
TEST(ArtifactNamingTest, TimestampWidth) {
  const std::string TS = formatTimestamp(std::time(nullptr));

  ASSERT_EQ(TS.size(), 14u);
  EXPECT_EQ(TS.find_first_not_of("0123456789"), std::string::npos);
}

/* ----------------------------- Unique Token Tests ----------------------------- */

/** @test An unused token is returned unchanged. */
TEST(ArtifactNamingTest, UniqueTokenNoCollision) {
  ScratchDir dir;

  EXPECT_EQ(uniqueToken(dir.path(), "pid", "20240101120000"), "20240101120000");
}

/** @test Any existing file of the set forces a suffix. */
TEST(ArtifactNamingTest, UniqueTokenSuffixes) {
  ScratchDir dir;
  dir.touch("pid_20240101120000.svg");

  EXPECT_EQ(uniqueToken(dir.path(), "pid", "20240101120000"), "20240101120000_1");

  dir.touch("out_20240101120000_1.folded");
  EXPECT_EQ(uniqueToken(dir.path(), "pid", "20240101120000"), "20240101120000_2");
}

/** @test The intermediate files collide across mode tags too. */
TEST(ArtifactNamingTest, UniqueTokenSharedIntermediates) {
  ScratchDir dir;
  dir.touch("out_20240101120000.perf");

  EXPECT_EQ(uniqueToken(dir.path(), "exec", "20240101120000"), "20240101120000_1");
}

/* ----------------------------- PipelineError Tests ----------------------------- */

/** @test The message names the failing stage. */
TEST(ArtifactNamingTest, PipelineErrorNamesStage) {
  const PipelineError ERR(PipelineStage::Collapse, "exited with status 3");

  EXPECT_EQ(ERR.stage(), PipelineStage::Collapse);
  EXPECT_STREQ(ERR.what(), "collapse failed: exited with status 3");
  EXPECT_STREQ(pipelineStageName(PipelineStage::Conversion), "conversion");
  EXPECT_STREQ(pipelineStageName(PipelineStage::Render), "render");
}
