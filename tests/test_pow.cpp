#include <gtest/gtest.h>
#include <atomic>
#include "poole/mining.hpp"
#include "poole/utils.hpp"

using namespace poole;

namespace
{
Block
template_on (const std::string &head)
{
  Block b;
  b.index = 1;
  b.prev_hash = head;
  b.marker = "hacker";
  return b;
}
}

TEST (PoW, DifficultyPrefix)
{
  EXPECT_EQ (difficulty_prefix (16), "0000");
  EXPECT_EQ (difficulty_prefix (0), "");
  EXPECT_EQ (leading_zero_digits ("000f"), 3u);
}

TEST (PoW, DifficultyCheckRejectsOffByOne)
{
  EXPECT_TRUE (meets_difficulty ("0000ab", 16));
  EXPECT_TRUE (meets_difficulty ("00000b", 16));
  EXPECT_FALSE (meets_difficulty ("000abc", 16));
  EXPECT_FALSE (meets_difficulty ("a00000", 16));
  EXPECT_TRUE (meets_difficulty ("anything", 0));
}

TEST (PoW, FindsLowestValidNonce)
{
  const std::string head = "h0";
  int checks = 0;
  auto check = [&] () {
    ++checks;
    return head;
  };

  SearchResult r = search (template_on (head), check, 8, 64);
  ASSERT_EQ (r.outcome, SearchOutcome::Found);
  EXPECT_TRUE (meets_difficulty (r.hash, 8));
  EXPECT_EQ (r.hash, hash_block (r.block));
  EXPECT_EQ (r.attempts, r.block.nonce + 1);
  // Interval checks plus the final one
  EXPECT_EQ (static_cast<uint64_t> (checks), r.block.nonce / 64 + 1);

  // No smaller nonce meets the target
  Block probe = template_on (head);
  for (uint64_t n = 0; n < r.block.nonce; ++n)
    {
      probe.nonce = n;
      EXPECT_FALSE (meets_difficulty (hash_block (probe), 8));
    }
}

TEST (PoW, AbortsWhenHeadMoves)
{
  int checks = 0;
  auto check = [&] () {
    ++checks;
    return std::string ("h1");
  };

  // 256 bits cannot be met within a handful of nonces
  SearchResult r = search (template_on ("h0"), check, 256, 4);
  EXPECT_EQ (r.outcome, SearchOutcome::Stale);
  EXPECT_EQ (r.attempts, 4u);
  EXPECT_EQ (checks, 1);
}

TEST (PoW, ChecksOnlyAtIntervalBoundaries)
{
  int checks = 0;
  auto check = [&] () {
    return ++checks < 3 ? std::string ("h0") : std::string ("h1");
  };

  SearchResult r = search (template_on ("h0"), check, 256, 10);
  EXPECT_EQ (r.outcome, SearchOutcome::Stale);
  EXPECT_EQ (r.attempts, 30u);
  EXPECT_EQ (checks, 3);
}

TEST (PoW, FinalCheckRejectsBlockFoundAsHeadMoves)
{
  int checks = 0;
  auto check = [&] () {
    ++checks;
    return std::string ("h1");
  };

  // Zero difficulty succeeds at nonce 0, before any interval check
  SearchResult r = search (template_on ("h0"), check, 0, 512);
  EXPECT_EQ (r.outcome, SearchOutcome::Stale);
  EXPECT_EQ (r.attempts, 1u);
  EXPECT_EQ (checks, 1);
}

TEST (PoW, CancelledAtBoundary)
{
  std::atomic<bool> cancel{ true };
  int checks = 0;
  auto check = [&] () {
    ++checks;
    return std::string ("h0");
  };

  SearchResult r = search (template_on ("h0"), check, 256, 8, &cancel);
  EXPECT_EQ (r.outcome, SearchOutcome::Cancelled);
  EXPECT_EQ (r.attempts, 8u);
  EXPECT_EQ (checks, 0);
}

TEST (PoW, ZeroIntervalIsRejected)
{
  auto check = [] () { return std::string ("h0"); };
  EXPECT_THROW (search (template_on ("h0"), check, 8, 0),
                std::invalid_argument);
}
