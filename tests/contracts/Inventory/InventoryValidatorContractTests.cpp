// Repository: Loopcast
// Component: Inventory Validator contract tests

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <algorithm>

#include "loopcast/catalog/InventoryValidator.hpp"
#include "loopcast/util/StreamErrors.hpp"
#include "fixtures/FakeMediaProber.h"
#include "support/TempDirectory.hpp"

using namespace loopcast;
using namespace loopcast::tests;

namespace
{

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage(
        "Inventory", {"INV-001", "INV-002", "INV-003", "INV-004", "INV-005"});
    return true;
  }();

  constexpr uint64_t kMiB = 1024 * 1024;

  class InventoryValidatorContractTest : public BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "Inventory";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"INV-001", "INV-002", "INV-003", "INV-004", "INV-005"};
    }

    TempDirectory media_{"loopcast_inventory"};
    FakeMediaProber prober_;
  };

  std::vector<std::string> PathsOf(const catalog::ValidatedInventory& inv)
  {
    std::vector<std::string> paths;
    for (const auto& item : inv)
    {
      paths.push_back(item.path);
    }
    return paths;
  }

  // Rule: INV-001 Recursive walk, extension (case-insensitive) and size filter
  TEST_F(InventoryValidatorContractTest, INV_001_FiltersByExtensionAndSizeRecursively)
  {
    const auto a = media_.WriteFile("a.mp4", 2 * kMiB);
    const auto b = media_.WriteFile("shows/season1/b.MKV", 2 * kMiB);
    const auto c = media_.WriteFile("deep/er/c.MoV", 2 * kMiB);
    media_.WriteFile("notes.txt", 2 * kMiB);
    media_.WriteFile("tiny.mp4", 100);
    media_.WriteFile("noext", 2 * kMiB);

    catalog::InventoryValidator validator(prober_);
    const auto candidates = validator.FindCandidates(media_.path(), kMiB);

    std::vector<std::string> paths;
    for (const auto& cand : candidates)
    {
      paths.push_back(cand.path);
    }
    std::vector<std::string> expected = {a, b, c};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(paths, expected);
    EXPECT_EQ(candidates.front().size_bytes, 2 * kMiB);
  }

  // Rule: INV-002 Probe failures, timeouts and short or unknown durations are skipped
  TEST_F(InventoryValidatorContractTest, INV_002_ProbeRejectionsAreSkippedNotFatal)
  {
    const auto good = media_.WriteFile("good.mp4", 2 * kMiB);
    const auto corrupt = media_.WriteFile("corrupt.mp4", 2 * kMiB);
    const auto slow = media_.WriteFile("slow.mkv", 2 * kMiB);
    const auto clip = media_.WriteFile("clip.m4v", 2 * kMiB);
    const auto unknown = media_.WriteFile("unknown.mov", 2 * kMiB);

    prober_.SetDuration(good, 1320.0);
    prober_.SetFailure(corrupt, "moov atom not found");
    prober_.SetTimeout(slow);
    prober_.SetDuration(clip, 30.0);
    prober_.SetUnknownDuration(unknown);

    catalog::InventoryValidator validator(prober_);
    const auto inventory = validator.BuildInventory(media_.path(), kMiB, 60.0);

    ASSERT_EQ(inventory.size(), 1u);
    EXPECT_EQ(inventory[0].path, good);
    ASSERT_TRUE(inventory[0].duration_seconds.has_value());
    EXPECT_DOUBLE_EQ(*inventory[0].duration_seconds, 1320.0);
    EXPECT_EQ(prober_.probed().size(), 5u);
  }

  // Rule: INV-003 Duration exactly at the minimum is accepted
  TEST_F(InventoryValidatorContractTest, INV_003_MinimumDurationIsInclusive)
  {
    const auto edge = media_.WriteFile("edge.mp4", kMiB);
    prober_.SetDuration(edge, 60.0);

    catalog::InventoryValidator validator(prober_);
    const auto inventory = validator.BuildInventory(media_.path(), kMiB, 60.0);
    EXPECT_EQ(PathsOf(inventory), std::vector<std::string>{edge});
  }

  // Rule: INV-004 Empty candidate set or empty validated set is NoMediaFound
  TEST_F(InventoryValidatorContractTest, INV_004_NoMediaFoundWhenNothingSurvives)
  {
    catalog::InventoryValidator validator(prober_);
    EXPECT_THROW(validator.BuildInventory(media_.path(), kMiB, 60.0), NoMediaFoundError);

    const auto only = media_.WriteFile("only.mp4", 2 * kMiB);
    prober_.SetFailure(only, "Invalid data found when processing input");
    EXPECT_THROW(validator.BuildInventory(media_.path(), kMiB, 60.0), NoMediaFoundError);

    EXPECT_THROW(validator.BuildInventory(media_.Join("missing"), kMiB, 60.0),
                 NoMediaFoundError);
  }

  // Rule: INV-005 Inventory is ordered by path and the probe timeout is forwarded
  TEST_F(InventoryValidatorContractTest, INV_005_InventoryOrderedByPathWithConfiguredTimeout)
  {
    const auto z = media_.WriteFile("z/last.mp4", 2 * kMiB);
    const auto a = media_.WriteFile("a/first.mp4", 2 * kMiB);
    const auto m = media_.WriteFile("middle.mkv", 2 * kMiB);

    catalog::InventoryOptions options;
    options.probe_timeout = std::chrono::milliseconds(2500);
    catalog::InventoryValidator validator(prober_, options);
    const auto inventory = validator.BuildInventory(media_.path(), kMiB, 60.0);

    std::vector<std::string> expected = {a, m, z};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(PathsOf(inventory), expected);
    EXPECT_EQ(prober_.last_timeout(), std::chrono::milliseconds(2500));
  }

  TEST_F(InventoryValidatorContractTest, HasSupportedExtensionIgnoresCase)
  {
    catalog::InventoryValidator validator(prober_);
    EXPECT_TRUE(validator.HasSupportedExtension("/x/Show.MP4"));
    EXPECT_TRUE(validator.HasSupportedExtension("/x/show.m4v"));
    EXPECT_FALSE(validator.HasSupportedExtension("/x/show.avi"));
    EXPECT_FALSE(validator.HasSupportedExtension("/x/mp4"));
  }

} // namespace
