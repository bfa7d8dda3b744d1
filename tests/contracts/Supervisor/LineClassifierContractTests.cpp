// Repository: Loopcast
// Component: Line Classifier contract tests

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include "loopcast/supervisor/LineClassifier.hpp"

using namespace loopcast;
using namespace loopcast::tests;
using supervisor::ClassifyLine;
using Kind = supervisor::HealthSignal::Kind;

namespace
{

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage("LineClassifier",
                                   {"LC-001", "LC-002", "LC-003", "LC-004", "LC-005"});
    return true;
  }();

  class LineClassifierContractTest : public BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "LineClassifier";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"LC-001", "LC-002", "LC-003", "LC-004", "LC-005"};
    }
  };

  // Rule: LC-001 Decoder corruption lines are critical
  TEST_F(LineClassifierContractTest, LC_001_CriticalDecoderPatterns)
  {
    EXPECT_EQ(ClassifyLine("[h264 @ 0x55d] Error submitting packet to decoder: Invalid data "
                           "found when processing input").kind,
              Kind::kCriticalDecodeError);
    EXPECT_EQ(ClassifyLine("Decoder thread returned error").kind, Kind::kCriticalDecodeError);
    EXPECT_EQ(ClassifyLine("Assertion failed. Internal bug, should not have happened").kind,
              Kind::kCriticalDecodeError);
    EXPECT_EQ(ClassifyLine("Error while decoding stream #0:0: Invalid data found").kind,
              Kind::kCriticalDecodeError);
  }

  // Rule: LC-002 Stats lines are progress, with or without a frame counter
  TEST_F(LineClassifierContractTest, LC_002_ProgressLines)
  {
    EXPECT_EQ(ClassifyLine("frame= 1234 fps= 30 q=28.0 size=    2048kB time=00:00:41.13 "
                           "bitrate= 407.9kbits/s speed=   1x").kind,
              Kind::kProgress);
    EXPECT_EQ(ClassifyLine("size=     512kB time=00:00:10.00 bitrate= 419.4kbits/s").kind,
              Kind::kProgress);
    EXPECT_EQ(ClassifyLine("frame=   10").kind, Kind::kInfo);
  }

  // Rule: LC-003 Non-critical error words are warnings, case-insensitive
  TEST_F(LineClassifierContractTest, LC_003_WarningLines)
  {
    EXPECT_EQ(ClassifyLine("[mp4 @ 0x1] Warning: timestamps are unset").kind, Kind::kWarning);
    EXPECT_EQ(ClassifyLine("Failed to open segment 'x.ts'").kind, Kind::kWarning);
    EXPECT_EQ(ClassifyLine("Invalid UTF-8 in metadata").kind, Kind::kWarning);
    EXPECT_EQ(ClassifyLine("Could not find codec parameters").kind, Kind::kWarning);
    EXPECT_EQ(ClassifyLine("[aac @ 0x2] ERROR in channel layout").kind, Kind::kWarning);
  }

  // Rule: LC-004 Input-open lines carry the opened path
  TEST_F(LineClassifierContractTest, LC_004_InputOpenedCarriesPath)
  {
    const auto signal = ClassifyLine("[concat @ 0x5600] Opening '/media/Show S01E02.mkv' for reading");
    EXPECT_EQ(signal.kind, Kind::kInputOpened);
    EXPECT_EQ(signal.opened_path, "/media/Show S01E02.mkv");

    // Writes are not inputs.
    EXPECT_NE(ClassifyLine("[hls @ 0x1] Opening '/app/hls/stream3.ts' for writing").kind,
              Kind::kInputOpened);
  }

  // Rule: LC-005 Everything else is info; the source line is preserved
  TEST_F(LineClassifierContractTest, LC_005_UnmatchedLinesAreInfo)
  {
    const auto signal = ClassifyLine("Stream mapping:");
    EXPECT_EQ(signal.kind, Kind::kInfo);
    EXPECT_EQ(signal.line, "Stream mapping:");
    EXPECT_FALSE(signal.input_path.has_value());
    EXPECT_EQ(ClassifyLine("").kind, Kind::kInfo);
  }

  TEST_F(LineClassifierContractTest, LevelTaggedLines)
  {
    // Entry opens surface at debug level in manifest mode.
    const auto opened =
        ClassifyLine("[concat @ 0x5600] [debug] Opening '/media/b.mp4' for reading");
    EXPECT_EQ(opened.kind, Kind::kInputOpened);
    EXPECT_EQ(opened.opened_path, "/media/b.mp4");

    EXPECT_EQ(ClassifyLine("[mov,mp4,m4a @ 0x77] [debug] invalid stts entry skipped").kind,
              Kind::kInfo);
    EXPECT_EQ(ClassifyLine("[AVIOContext @ 0x1] [verbose] Statistics: 0 seeks, failed 0").kind,
              Kind::kInfo);
    EXPECT_EQ(ClassifyLine("[mp4 @ 0x1] [warning] timestamps are unset").kind, Kind::kWarning);
    EXPECT_EQ(ClassifyLine("[h264 @ 0x2] [error] Error while decoding stream #0:0").kind,
              Kind::kCriticalDecodeError);
  }

  TEST_F(LineClassifierContractTest, FirstMatchingRowWins)
  {
    const std::vector<supervisor::ClassificationRule> table = {
        {Kind::kWarning, {"decoder"}, true},
        {Kind::kCriticalDecodeError, {"Decoder thread returned error"}},
    };
    EXPECT_EQ(ClassifyLine("Decoder thread returned error", table).kind, Kind::kWarning);
  }

} // namespace
