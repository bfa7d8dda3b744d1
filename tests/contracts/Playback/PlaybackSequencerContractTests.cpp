// Repository: Loopcast
// Component: Playback Sequencer contract tests

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <algorithm>
#include <memory>
#include <set>

#include "loopcast/playback/PlaybackSequencer.hpp"
#include "loopcast/util/StreamErrors.hpp"
#include "support/TempDirectory.hpp"

using namespace loopcast;
using namespace loopcast::tests;
using playback::Denylist;
using playback::PlaybackSequencer;
using State = playback::PlaybackSequencer::State;

namespace
{

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage(
        "PlaybackSequencer",
        {"SEQ-001", "SEQ-002", "SEQ-003", "SEQ-004", "SEQ-005", "SEQ-006", "SEQ-007"});
    return true;
  }();

  catalog::ValidatedInventory MakeInventory(size_t n)
  {
    catalog::ValidatedInventory inv;
    for (size_t i = 0; i < n; ++i)
    {
      catalog::MediaItem item;
      item.path = "/media/item" + std::to_string(i) + ".mp4";
      item.size_bytes = 10 * 1024 * 1024;
      item.duration_seconds = 1200.0;
      inv.push_back(item);
    }
    return inv;
  }

  std::set<std::string> PathSet(const std::vector<catalog::MediaItem>& items)
  {
    std::set<std::string> out;
    for (const auto& item : items)
    {
      out.insert(item.path);
    }
    return out;
  }

  class PlaybackSequencerContractTest : public BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "PlaybackSequencer";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"SEQ-001", "SEQ-002", "SEQ-003", "SEQ-004", "SEQ-005", "SEQ-006", "SEQ-007"};
    }

    std::shared_ptr<Denylist> MakeDenylist()
    {
      return std::make_shared<Denylist>(dir_.Join("denylist.txt"));
    }

    std::unique_ptr<PlaybackSequencer> MakeSequencer(size_t n, uint32_t seed = 7)
    {
      playback::SequencerOptions options;
      options.seed = seed;
      return std::make_unique<PlaybackSequencer>(MakeInventory(n), MakeDenylist(), options);
    }

    TempDirectory dir_{"loopcast_sequencer"};
  };

  // Rule: SEQ-001 The sequencer starts exhausted; the first Next() shuffles
  TEST_F(PlaybackSequencerContractTest, SEQ_001_StartsExhaustedFirstNextStartsCycleOne)
  {
    auto seq = MakeSequencer(4);
    EXPECT_EQ(seq->state(), State::kExhausted);
    EXPECT_EQ(seq->GetSnapshot().cycle_count, 0u);

    seq->Next();
    const auto snap = seq->GetSnapshot();
    EXPECT_EQ(snap.cycle_count, 1u);
    EXPECT_EQ(snap.cursor, 1u);
    EXPECT_EQ(snap.state, State::kReady);
  }

  // Rule: SEQ-002 N consecutive Next() calls return each item exactly once
  TEST_F(PlaybackSequencerContractTest, SEQ_002_EachCycleIsAPermutation)
  {
    const size_t n = 9;
    auto seq = MakeSequencer(n);
    const auto all = PathSet(MakeInventory(n));

    for (int cycle = 1; cycle <= 3; ++cycle)
    {
      std::set<std::string> seen;
      for (size_t i = 0; i < n; ++i)
      {
        seen.insert(seq->Next().path);
      }
      EXPECT_EQ(seen, all) << "cycle " << cycle;
      EXPECT_EQ(seq->GetSnapshot().cycle_count, static_cast<uint64_t>(cycle));
      EXPECT_EQ(seq->state(), State::kExhausted);
    }
  }

  // Rule: SEQ-003 The (N+1)th call reshuffles exactly once
  TEST_F(PlaybackSequencerContractTest, SEQ_003_NPlusOneCallReshufflesOnce)
  {
    const size_t n = 5;
    auto seq = MakeSequencer(n);
    for (size_t i = 0; i < n; ++i)
    {
      seq->Next();
    }
    EXPECT_EQ(seq->GetSnapshot().cycle_count, 1u);
    seq->Next();
    const auto snap = seq->GetSnapshot();
    EXPECT_EQ(snap.cycle_count, 2u);
    EXPECT_EQ(snap.cursor, 1u);
    EXPECT_EQ(snap.played_total, n + 1);
  }

  // Rule: SEQ-004 ReportBad removes every occurrence, adjusts the cursor, persists
  TEST_F(PlaybackSequencerContractTest, SEQ_004_ReportBadRemovesAndKeepsCursorConsistent)
  {
    auto seq = MakeSequencer(6);
    seq->Next();
    seq->Next();
    const auto order = seq->Order();
    const std::string played_bad = order[0].path;
    const std::string upcoming = order[2].path;

    seq->ReportBad(played_bad);
    auto snap = seq->GetSnapshot();
    EXPECT_EQ(snap.order_size, 5u);
    EXPECT_EQ(snap.cursor, 1u);

    // The item that was next is still next.
    EXPECT_EQ(seq->Next().path, upcoming);

    // Idempotent.
    seq->ReportBad(played_bad);
    EXPECT_EQ(seq->GetSnapshot().order_size, 5u);

    // Never handed out again, in this cycle or later ones.
    for (int i = 0; i < 20; ++i)
    {
      EXPECT_NE(seq->Next().path, played_bad);
    }

    Denylist reloaded(dir_.Join("denylist.txt"));
    EXPECT_TRUE(reloaded.Contains(played_bad));
    EXPECT_EQ(reloaded.Size(), 1u);
  }

  // Rule: SEQ-005 Denylisted paths are excluded at construction (restart)
  TEST_F(PlaybackSequencerContractTest, SEQ_005_DenylistAppliesAcrossRestart)
  {
    {
      auto seq = MakeSequencer(3);
      seq->ReportBad("/media/item1.mp4");
    }
    auto restarted = MakeSequencer(3);
    EXPECT_EQ(restarted->GetSnapshot().order_size, 2u);
    for (int i = 0; i < 6; ++i)
    {
      EXPECT_NE(restarted->Next().path, "/media/item1.mp4");
    }
  }

  // Rule: SEQ-006 Reporting every item bad leaves the terminal Empty state
  TEST_F(PlaybackSequencerContractTest, SEQ_006_AllBadIsEmptyAndNextThrows)
  {
    auto seq = MakeSequencer(2);
    seq->Next();
    seq->ReportBad("/media/item0.mp4");
    seq->ReportBad("/media/item1.mp4");
    EXPECT_EQ(seq->state(), State::kEmpty);
    EXPECT_THROW(seq->Next(), NoPlayableMediaError);
    EXPECT_THROW(seq->BeginManifestCycle(), NoPlayableMediaError);

    // Fully denylisted inventory starts Empty.
    auto restarted = MakeSequencer(2);
    EXPECT_EQ(restarted->state(), State::kEmpty);
    EXPECT_THROW(restarted->Next(), NoPlayableMediaError);
  }

  // Rule: SEQ-007 A one-item inventory reshuffles every call without failing
  TEST_F(PlaybackSequencerContractTest, SEQ_007_SingleItemInventory)
  {
    auto seq = MakeSequencer(1);
    for (int i = 1; i <= 4; ++i)
    {
      EXPECT_EQ(seq->Next().path, "/media/item0.mp4");
      EXPECT_EQ(seq->GetSnapshot().cycle_count, static_cast<uint64_t>(i));
    }
  }

  TEST_F(PlaybackSequencerContractTest, HistoryIsCappedAndOptionallyClearedOnReshuffle)
  {
    playback::SequencerOptions options;
    options.seed = 3;
    options.history_limit = 4;
    PlaybackSequencer capped(MakeInventory(3), MakeDenylist(), options);
    for (int i = 0; i < 10; ++i)
    {
      capped.Next();
    }
    EXPECT_EQ(capped.History().size(), 4u);
    EXPECT_EQ(capped.GetSnapshot().played_total, 10u);
    EXPECT_EQ(capped.GetSnapshot(2).recent.size(), 2u);

    options.clear_history_on_reshuffle = true;
    options.history_limit = 100;
    PlaybackSequencer clearing(MakeInventory(3), MakeDenylist(), options);
    for (int i = 0; i < 4; ++i)
    {
      clearing.Next();
    }
    EXPECT_EQ(clearing.History().size(), 1u);
  }

  TEST_F(PlaybackSequencerContractTest, ManifestCycleReturnsWholeOrderAndTracksPlaying)
  {
    auto seq = MakeSequencer(5);
    const auto order = seq->BeginManifestCycle();
    EXPECT_EQ(PathSet(order), PathSet(MakeInventory(5)));
    EXPECT_EQ(seq->GetSnapshot().cycle_count, 1u);

    seq->NotePlaying(order[0].path);
    seq->NotePlaying(order[1].path);
    const auto snap = seq->GetSnapshot();
    EXPECT_EQ(snap.played_total, 2u);
    ASSERT_EQ(snap.recent.size(), 2u);
    EXPECT_EQ(snap.recent.back(), order[1].path);

    seq->BeginManifestCycle();
    EXPECT_EQ(seq->GetSnapshot().cycle_count, 2u);
  }

  TEST_F(PlaybackSequencerContractTest, SameSeedGivesSameOrder)
  {
    auto a = MakeSequencer(8, 42);
    auto b = MakeSequencer(8, 42);
    for (int i = 0; i < 8; ++i)
    {
      EXPECT_EQ(a->Next().path, b->Next().path);
    }
  }

} // namespace
