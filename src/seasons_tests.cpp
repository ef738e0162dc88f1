/*
    Emporium - economy and progression engine for games
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "private/seasons.hpp"

#include "catalog.hpp"
#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace emporium
{
namespace
{

class SeasonsTests : public DBTest
{

protected:

  SeasonEngine seasons;

  SeasonsTests ()
    : seasons(db, ledger, inventory, clock, 1'000)
  {
    LoadCatalog (db, ParseTextProto<proto::Config> (R"(
      seasons:
        {
          id: "s1"
          game: "game"
          name: "Season 1"
          battle_pass_price: 500
          tiers:
            {
              tier_number: 1
              xp_required: 100
              reward_type: CURRENCY
              reward_amount: 10
            }
          tiers:
            {
              tier_number: 2
              xp_required: 150
              reward_type: ITEM
              reward_item: "hat"
            }
          tiers:
            {
              tier_number: 3
              xp_required: 200
              reward_type: PREMIUM_CURRENCY
              reward_amount: 50
              is_premium: true
            }
        }
      seasons:
        {
          id: "s2"
          game: "game"
          name: "Season 2"
        }
    )"));

    SetupAccount ("alice", 1'000);
  }

  proto::XpAward
  Award (const Amount amount, const std::string& season = "s1")
  {
    return Run ([this, amount, &season] ()
      {
        return seasons.AwardXp ("alice", season, amount, "match");
      });
  }

  proto::ClaimedReward
  Claim (const uint32_t tier)
  {
    return Run ([this, tier] ()
      {
        return seasons.ClaimReward ("alice", "s1", tier);
      });
  }

};

TEST_F (SeasonsTests, RolloverAcrossTiers)
{
  const auto res = Award (300);

  EXPECT_TRUE (res.tiered_up ());
  EXPECT_THAT (res.progression (), EqualsProgression (R"(
    id: 1
    competitor: "alice"
    season: "s1"
    current_tier: 2
    current_xp: 50
    has_battle_pass: false
  )"));

  ASSERT_EQ (res.tier_up_rewards_size (), 2);
  EXPECT_THAT (res.tier_up_rewards (0), EqualsTier (R"(
    season: "s1"
    tier_number: 1
    xp_required: 100
    reward_type: CURRENCY
    reward_amount: 10
    is_premium: false
  )"));
  EXPECT_EQ (res.tier_up_rewards (1).tier_number (), 2u);
  EXPECT_EQ (res.tier_up_rewards (1).reward_item (), "hat");

  EXPECT_EQ (CountRows ("season_xp_history"), 1);
}

TEST_F (SeasonsTests, SmallAwards)
{
  auto res = Award (50);
  EXPECT_FALSE (res.tiered_up ());
  EXPECT_EQ (res.progression ().current_tier (), 0u);
  EXPECT_EQ (res.progression ().current_xp (), 50);

  res = Award (60);
  EXPECT_TRUE (res.tiered_up ());
  EXPECT_EQ (res.progression ().current_tier (), 1u);
  EXPECT_EQ (res.progression ().current_xp (), 10);
  ASSERT_EQ (res.tier_up_rewards_size (), 1);

  res = Award (140);
  EXPECT_EQ (res.progression ().current_tier (), 2u);
  EXPECT_EQ (res.progression ().current_xp (), 0);

  EXPECT_EQ (CountRows ("season_progression"), 1);
  EXPECT_EQ (CountRows ("season_xp_history"), 3);
}

TEST_F (SeasonsTests, MaximumTier)
{
  auto res = Award (10'000);
  EXPECT_EQ (res.progression ().current_tier (), 3u);
  EXPECT_EQ (res.progression ().current_xp (), 0);
  EXPECT_EQ (res.tier_up_rewards_size (), 3);

  res = Award (500);
  EXPECT_FALSE (res.tiered_up ());
  EXPECT_EQ (res.progression ().current_tier (), 3u);
  EXPECT_EQ (res.progression ().current_xp (), 0);
}

TEST_F (SeasonsTests, AwardErrors)
{
  ExpectError (ErrorKind::SEASON_NOT_FOUND, [this] ()
    {
      seasons.AwardXp ("alice", "invalid", 10, "match");
    });
  ExpectError (ErrorKind::INVALID_ARGUMENT, [this] ()
    {
      seasons.AwardXp ("alice", "s1", 0, "match");
    });
  ExpectError (ErrorKind::INVALID_ARGUMENT, [this] ()
    {
      seasons.AwardXp ("alice", "s1", -10, "match");
    });

  EXPECT_EQ (CountRows ("season_progression"), 0);
}

TEST_F (SeasonsTests, DefaultTierCurve)
{
  const auto res = Award (1'000 + 1'050 + 10, "s2");
  EXPECT_EQ (res.progression ().current_tier (), 2u);
  EXPECT_EQ (res.progression ().current_xp (), 10);

  const auto tiers = Run ([this] ()
    {
      return seasons.GetTiers ("s2");
    });
  ASSERT_EQ (tiers.size (), 100u);
  EXPECT_EQ (tiers[4].tier_number (), 5u);
  EXPECT_TRUE (tiers[4].is_premium ());
}

TEST_F (SeasonsTests, ClaimCurrency)
{
  ExpectError (ErrorKind::TIER_NOT_REACHED, [this] ()
    {
      seasons.ClaimReward ("alice", "s1", 1);
    });

  Award (100);
  const auto res = Claim (1);
  EXPECT_EQ (res.progression_id (), 1u);
  EXPECT_EQ (res.tier_number (), 1u);
  EXPECT_EQ (res.claimed_at (), TestClock::START);
  EXPECT_EQ (res.tier ().reward_amount (), 10);
  EXPECT_EQ (GetBalance ("alice"), 1'010);

  ExpectError (ErrorKind::TIER_NOT_REACHED, [this] ()
    {
      seasons.ClaimReward ("alice", "s1", 2);
    });
}

TEST_F (SeasonsTests, ClaimIsIdempotent)
{
  Award (100);
  Claim (1);

  for (int i = 0; i < 3; ++i)
    ExpectError (ErrorKind::ALREADY_CLAIMED, [this] ()
      {
        seasons.ClaimReward ("alice", "s1", 1);
      });

  EXPECT_EQ (GetBalance ("alice"), 1'010);
  EXPECT_EQ (CountRows ("claimed_reward"), 1);
}

TEST_F (SeasonsTests, ClaimItem)
{
  Award (250);
  Claim (2);
  EXPECT_EQ (GetQuantity ("alice", "hat"), 1);
  EXPECT_EQ (GetBalance ("alice"), 1'000);
}

TEST_F (SeasonsTests, ClaimPremium)
{
  Award (450);

  ExpectError (ErrorKind::BATTLE_PASS_REQUIRED, [this] ()
    {
      seasons.ClaimReward ("alice", "s1", 3);
    });

  Run ([this] ()
    {
      return seasons.PurchaseBattlePass ("alice", "s1", 0);
    });
  Claim (3);
  EXPECT_EQ (GetBalance ("alice"), 1'000 - 500 + 50);
}

TEST_F (SeasonsTests, ClaimUnknownTier)
{
  Award (10);
  ExpectError (ErrorKind::TIER_NOT_FOUND, [this] ()
    {
      seasons.ClaimReward ("alice", "s1", 0);
    });
}

TEST_F (SeasonsTests, FailedPayoutIsNotRecorded)
{
  Run ([this] ()
    {
      return seasons.AwardXp ("bob", "s1", 100, "match");
    });
  ExpectError (ErrorKind::RECIPIENT_NOT_FOUND, [this] ()
    {
      seasons.ClaimReward ("bob", "s1", 1);
    });
  EXPECT_EQ (CountRows ("claimed_reward"), 0);

  SetupAccount ("bob", 0);
  Run ([this] ()
    {
      return seasons.ClaimReward ("bob", "s1", 1);
    });
  EXPECT_EQ (GetBalance ("bob"), 10);
}

TEST_F (SeasonsTests, BattlePass)
{
  clock.Advance (100);
  const auto pass = Run ([this] ()
    {
      return seasons.PurchaseBattlePass ("alice", "s1", 0);
    });
  EXPECT_EQ (pass.price_paid (), 500);
  EXPECT_EQ (pass.purchased_at (), TestClock::START + 100);
  EXPECT_THAT (pass.progression (), EqualsProgression (R"(
    id: 1
    competitor: "alice"
    season: "s1"
    current_tier: 0
    current_xp: 0
    has_battle_pass: true
  )"));
  EXPECT_EQ (GetBalance ("alice"), 500);

  ExpectError (ErrorKind::ALREADY_PURCHASED, [this] ()
    {
      seasons.PurchaseBattlePass ("alice", "s1", 0);
    });
  EXPECT_EQ (GetBalance ("alice"), 500);

  /* The flag survives further XP awards.  */
  EXPECT_TRUE (Award (10).progression ().has_battle_pass ());
}

TEST_F (SeasonsTests, BattlePassPrices)
{
  ExpectError (ErrorKind::INSUFFICIENT_FUNDS, [this] ()
    {
      seasons.PurchaseBattlePass ("alice", "s2", 1'001);
    });
  EXPECT_EQ (CountRows ("battle_pass"), 0);
  EXPECT_EQ (CountRows ("season_progression"), 0);

  const auto pass = Run ([this] ()
    {
      return seasons.PurchaseBattlePass ("alice", "s2", -1);
    });
  EXPECT_EQ (pass.price_paid (), 1'000);
  EXPECT_EQ (GetBalance ("alice"), 0);
}

TEST_F (SeasonsTests, BattlePassErrors)
{
  ExpectError (ErrorKind::SEASON_NOT_FOUND, [this] ()
    {
      seasons.PurchaseBattlePass ("alice", "invalid", 0);
    });
  ExpectError (ErrorKind::INSUFFICIENT_FUNDS, [this] ()
    {
      seasons.PurchaseBattlePass ("bob", "s1", 0);
    });
}

TEST_F (SeasonsTests, ProgressionWithoutWrites)
{
  const auto res = Run ([this] ()
    {
      return seasons.GetProgression ("alice", "s1");
    });
  EXPECT_EQ (res.progression ().current_tier (), 0u);
  EXPECT_EQ (res.progression ().current_xp (), 0);
  EXPECT_FALSE (res.progression ().has_battle_pass ());
  EXPECT_EQ (res.next_tier_xp (), 100);
  ASSERT_EQ (res.rewards_size (), 3);
  for (const auto& r : res.rewards ())
    {
      EXPECT_FALSE (r.is_claimed ());
      EXPECT_FALSE (r.is_available ());
    }

  EXPECT_EQ (CountRows ("season_progression"), 0);

  ExpectError (ErrorKind::SEASON_NOT_FOUND, [this] ()
    {
      seasons.GetProgression ("alice", "invalid");
    });
}

TEST_F (SeasonsTests, ProgressionRewardStatus)
{
  Award (450);
  Claim (1);

  const auto res = Run ([this] ()
    {
      return seasons.GetProgression ("alice", "s1");
    });
  EXPECT_EQ (res.progression ().current_tier (), 3u);
  EXPECT_FALSE (res.has_next_tier_xp ());
  ASSERT_EQ (res.rewards_size (), 3);

  EXPECT_TRUE (res.rewards (0).is_claimed ());
  EXPECT_FALSE (res.rewards (0).is_available ());
  EXPECT_FALSE (res.rewards (1).is_claimed ());
  EXPECT_TRUE (res.rewards (1).is_available ());
  EXPECT_FALSE (res.rewards (2).is_claimed ());
  EXPECT_FALSE (res.rewards (2).is_available ());
}

TEST_F (SeasonsTests, ProgressionLookahead)
{
  const auto res = Run ([this] ()
    {
      return seasons.GetProgression ("alice", "s2");
    });
  EXPECT_EQ (res.next_tier_xp (), 1'000);
  ASSERT_EQ (res.rewards_size (), 5);
  EXPECT_EQ (res.rewards (4).tier ().tier_number (), 5u);
}

} // anonymous namespace
} // namespace emporium
