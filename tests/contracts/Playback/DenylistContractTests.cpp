// Repository: Loopcast
// Component: Denylist contract tests

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <filesystem>

#include "loopcast/playback/Denylist.hpp"
#include "support/TempDirectory.hpp"

using namespace loopcast;
using namespace loopcast::tests;
using playback::Denylist;
using playback::DenylistAddStatus;

namespace
{

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage("Denylist", {"DL-001", "DL-002", "DL-003"});
    return true;
  }();

  class DenylistContractTest : public BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "Denylist";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"DL-001", "DL-002", "DL-003"};
    }

    TempDirectory dir_{"loopcast_denylist"};
  };

  // Rule: DL-001 Add is idempotent and persisted once
  TEST_F(DenylistContractTest, DL_001_AddIsIdempotentAndWritesOnce)
  {
    const std::string file = dir_.Join("denylist.txt");
    Denylist denylist(file);
    EXPECT_EQ(denylist.Size(), 0u);

    EXPECT_EQ(denylist.Add("/media/bad.mp4"), DenylistAddStatus::kAdded);
    EXPECT_EQ(denylist.Add("/media/bad.mp4"), DenylistAddStatus::kAlreadyPresent);
    EXPECT_TRUE(denylist.Contains("/media/bad.mp4"));
    EXPECT_EQ(denylist.Size(), 1u);

    EXPECT_EQ(ReadWholeFile(file), "/media/bad.mp4\n");
  }

  // Rule: DL-002 Entries survive a restart; blank lines are ignored on load
  TEST_F(DenylistContractTest, DL_002_LoadSkipsBlankLinesAndSurvivesRestart)
  {
    const std::string file = dir_.WriteText("denylist.txt",
                                            "/media/a.mp4\n\n   \n/media/b.mkv\r\n");
    {
      Denylist denylist(file);
      EXPECT_EQ(denylist.Size(), 2u);
      EXPECT_TRUE(denylist.Contains("/media/a.mp4"));
      EXPECT_TRUE(denylist.Contains("/media/b.mkv"));
      EXPECT_EQ(denylist.Add("/media/c.mov"), DenylistAddStatus::kAdded);
    }
    Denylist reloaded(file);
    EXPECT_EQ(reloaded.Size(), 3u);
    EXPECT_TRUE(reloaded.Contains("/media/c.mov"));
  }

  // Rule: DL-003 A file whose last line lacks a newline is appended safely
  TEST_F(DenylistContractTest, DL_003_AppendAfterUnterminatedLastLine)
  {
    const std::string file = dir_.WriteText("denylist.txt", "/media/a.mp4");
    {
      Denylist denylist(file);
      ASSERT_EQ(denylist.Add("/media/b.mp4"), DenylistAddStatus::kAdded);
    }
    Denylist reloaded(file);
    EXPECT_TRUE(reloaded.Contains("/media/a.mp4"));
    EXPECT_TRUE(reloaded.Contains("/media/b.mp4"));
    EXPECT_EQ(reloaded.Size(), 2u);
  }

  TEST_F(DenylistContractTest, MissingFileIsEmptyAndCreatedOnFirstAdd)
  {
    const std::string file = dir_.Join("denylist.txt");
    Denylist denylist(file);
    EXPECT_EQ(denylist.Size(), 0u);
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_EQ(denylist.Add("/media/x.mp4"), DenylistAddStatus::kAdded);
    EXPECT_TRUE(std::filesystem::exists(file));
  }

} // namespace
