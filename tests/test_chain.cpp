#include <gtest/gtest.h>
#include "fake_ledger.hpp"
#include "poole/chain.hpp"

using namespace poole;
using poole_test::FakeLedger;

namespace
{
// Genesis plus `extra` blocks: indices 0..extra
void
grow (FakeLedger &ledger, int extra)
{
  for (int i = 0; i < extra; ++i)
    ledger.append (Block{});
}
}

TEST (Chain, ReturnsBlocksOldestFirst)
{
  FakeLedger ledger;
  grow (ledger, 5);

  ChainReader reader (ledger);
  ChainSnapshot chain = reader.reconstruct ();

  ASSERT_EQ (chain.blocks.size (), 6u);
  EXPECT_TRUE (chain.complete);
  for (size_t i = 0; i < chain.blocks.size (); ++i)
    {
      EXPECT_EQ (chain.blocks[i].index, i);
      EXPECT_EQ (hash_block (chain.blocks[i]), ledger.order ()[i]);
    }
  EXPECT_FALSE (chain.blocks.front ().prev_hash.has_value ());
}

TEST (Chain, GenesisOnly)
{
  FakeLedger ledger;
  ChainReader reader (ledger);
  ChainSnapshot chain = reader.reconstruct ();

  ASSERT_EQ (chain.blocks.size (), 1u);
  EXPECT_TRUE (chain.complete);
  EXPECT_TRUE (ledger.lookups.empty ());
}

TEST (Chain, FailedFetchTruncates)
{
  FakeLedger ledger;
  grow (ledger, 5);
  // Fetching B2 times out: only B3..B5 were retrieved
  ledger.failing.insert (ledger.order ()[2]);

  ChainReader reader (ledger);
  ChainSnapshot chain = reader.reconstruct ();

  ASSERT_EQ (chain.blocks.size (), 3u);
  EXPECT_FALSE (chain.complete);
  EXPECT_EQ (chain.blocks[0].index, 3u);
  EXPECT_EQ (chain.blocks[1].index, 4u);
  EXPECT_EQ (chain.blocks[2].index, 5u);
}

TEST (Chain, UnknownBlockTruncates)
{
  FakeLedger ledger;
  grow (ledger, 3);
  ledger.missing.insert (ledger.order ()[0]);

  ChainReader reader (ledger);
  ChainSnapshot chain = reader.reconstruct ();

  ASSERT_EQ (chain.blocks.size (), 3u);
  EXPECT_FALSE (chain.complete);
  EXPECT_EQ (chain.blocks.front ().index, 1u);
}

TEST (Chain, HeadFailurePropagates)
{
  FakeLedger ledger;
  ledger.fail_head = true;
  ChainReader reader (ledger);
  EXPECT_THROW (reader.reconstruct (), LedgerError);
}

TEST (Chain, CountMarked)
{
  FakeLedger ledger;
  ledger.append_marked ("hacker");
  ledger.append (Block{});
  ledger.append_marked ("eve");
  ledger.append_marked ("hacker");

  ChainReader reader (ledger);
  ChainSnapshot chain = reader.reconstruct ();
  EXPECT_EQ (count_marked (chain.blocks, "hacker"), 2u);
  EXPECT_EQ (count_marked (chain.blocks, "eve"), 1u);
  EXPECT_EQ (count_marked (chain.blocks, "nobody"), 0u);
}

TEST (Chain, BackLinkCycleStopsWalk)
{
  FakeLedger ledger;
  Block a;
  a.index = 2;
  a.prev_hash = "B";
  Block b;
  b.index = 1;
  b.prev_hash = "A";
  ledger.put ("A", a);
  ledger.put ("B", b);
  ledger.set_head ("A");

  ChainReader reader (ledger);
  ChainSnapshot chain = reader.reconstruct ();

  ASSERT_EQ (chain.blocks.size (), 2u);
  EXPECT_FALSE (chain.complete);
  EXPECT_EQ (chain.blocks[0].index, 1u);
  EXPECT_EQ (chain.blocks[1].index, 2u);
  EXPECT_EQ (ledger.lookups, (std::vector<std::string>{ "B" }));
}

TEST (Chain, SelfLinkedHeadStopsWalk)
{
  FakeLedger ledger;
  Block s;
  s.index = 7;
  s.prev_hash = "S";
  ledger.put ("S", s);
  ledger.set_head ("S");

  ChainReader reader (ledger);
  ChainSnapshot chain = reader.reconstruct ();

  ASSERT_EQ (chain.blocks.size (), 1u);
  EXPECT_FALSE (chain.complete);
  EXPECT_TRUE (ledger.lookups.empty ());
}
