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

#include "errors.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <limits>
#include <sstream>

namespace emporium
{

DEFINE_int32 (emporium_reward_lookahead, 5,
              "Number of tiers beyond the current one for which the reward"
              " status is reported");

namespace
{

/** Columns to select for reading a tier with ReadTier.  */
constexpr const char* TIER_COLUMNS = R"(
  `season`, `tier_number`, `xp_required`,
  `reward_type`, `reward_amount`, `reward_item`, `is_premium`
)";

/**
 * Reads a tier from a statement that selected TIER_COLUMNS.
 */
proto::SeasonTier
ReadTier (const Database::Statement& stmt)
{
  proto::SeasonTier res;
  res.set_season (stmt.Get<std::string> (0));
  res.set_tier_number (stmt.Get<unsigned> (1));
  res.set_xp_required (stmt.Get<int64_t> (2));

  proto::SeasonTier::RewardType type;
  CHECK (proto::SeasonTier::RewardType_Parse (stmt.Get<std::string> (3),
                                              &type));
  res.set_reward_type (type);

  res.set_reward_amount (stmt.Get<int64_t> (4));
  if (!stmt.IsNull (5))
    res.set_reward_item (stmt.Get<std::string> (5));
  res.set_is_premium (stmt.Get<bool> (6));

  return res;
}

std::string
DescribeTier (const std::string& season, const uint32_t tier)
{
  std::ostringstream out;
  out << "season " << season << " tier " << tier;
  return out.str ();
}

} // anonymous namespace

bool
SeasonEngine::LookupSeason (const std::string& id, proto::Season& out)
{
  auto stmt = db.Prepare (R"(
    SELECT `game`, `name`, `battle_pass_price`
      FROM `season`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, id);

  if (!stmt.Step ())
    return false;

  out.Clear ();
  out.set_id (id);
  out.set_game (stmt.Get<std::string> (0));
  out.set_name (stmt.Get<std::string> (1));
  if (!stmt.IsNull (2))
    out.set_battle_pass_price (stmt.Get<int64_t> (2));

  return true;
}

bool
SeasonEngine::LookupTier (const std::string& season, const uint32_t tier,
                          proto::SeasonTier& out)
{
  auto stmt = db.Prepare (std::string ("SELECT ") + TIER_COLUMNS + R"(
      FROM `season_tier`
      WHERE `season` = ?1 AND `tier_number` = ?2
  )");
  stmt.Bind (1, season);
  stmt.Bind (2, tier);

  if (!stmt.Step ())
    return false;

  out = ReadTier (stmt);
  return true;
}

bool
SeasonEngine::LookupProgression (const std::string& competitor,
                                 const std::string& season,
                                 proto::SeasonProgression& out)
{
  auto stmt = db.Prepare (R"(
    SELECT `id`, `current_tier`, `current_xp`, `has_battle_pass`
      FROM `season_progression`
      WHERE `competitor` = ?1 AND `season` = ?2
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, season);

  if (!stmt.Step ())
    return false;

  out.Clear ();
  out.set_id (stmt.Get<uint64_t> (0));
  out.set_competitor (competitor);
  out.set_season (season);
  out.set_current_tier (stmt.Get<unsigned> (1));
  out.set_current_xp (stmt.Get<int64_t> (2));
  out.set_has_battle_pass (stmt.Get<bool> (3));

  return true;
}

proto::SeasonProgression
SeasonEngine::EnsureProgression (const std::string& competitor,
                                 const std::string& season)
{
  {
    auto stmt = db.Prepare (R"(
      INSERT OR IGNORE INTO `season_progression`
        (`competitor`, `season`, `current_tier`, `current_xp`,
         `has_battle_pass`)
        VALUES (?1, ?2, 0, 0, 0)
    )");
    stmt.Bind (1, competitor);
    stmt.Bind (2, season);
    stmt.Execute ();
  }

  proto::SeasonProgression res;
  CHECK (LookupProgression (competitor, season, res));

  return res;
}

void
SeasonEngine::UpdateProgression (const proto::SeasonProgression& progression)
{
  auto stmt = db.Prepare (R"(
    UPDATE `season_progression`
      SET `current_tier` = ?2, `current_xp` = ?3, `has_battle_pass` = ?4
      WHERE `id` = ?1
  )");
  stmt.Bind (1, progression.id ());
  stmt.Bind (2, progression.current_tier ());
  stmt.Bind (3, progression.current_xp ());
  stmt.Bind (4, progression.has_battle_pass ());
  stmt.Execute ();
}

bool
SeasonEngine::IsClaimed (const uint64_t progression, const uint32_t tier)
{
  auto stmt = db.Prepare (R"(
    SELECT COUNT(*)
      FROM `claimed_reward`
      WHERE `progression` = ?1 AND `tier_number` = ?2
  )");
  stmt.Bind (1, progression);
  stmt.Bind (2, tier);

  CHECK (stmt.Step ());
  return stmt.Get<int64_t> (0) > 0;
}

bool
SeasonEngine::HasBattlePass (const std::string& competitor,
                             const std::string& season)
{
  auto stmt = db.Prepare (R"(
    SELECT COUNT(*)
      FROM `battle_pass`
      WHERE `competitor` = ?1 AND `season` = ?2
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, season);

  CHECK (stmt.Step ());
  return stmt.Get<int64_t> (0) > 0;
}

proto::XpAward
SeasonEngine::AwardXp (const std::string& competitor,
                       const std::string& season, const Amount amount,
                       const std::string& source)
{
  CHECK (db.IsInTransaction ());

  if (competitor.empty () || amount <= 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "invalid XP award for " + competitor);

  proto::Season seasonData;
  if (!LookupSeason (season, seasonData))
    throw GameError (ErrorKind::SEASON_NOT_FOUND,
                     "season not found: " + season);

  proto::XpAward res;
  auto& progression = *res.mutable_progression ();
  progression = EnsureProgression (competitor, season);
  const uint32_t tierBefore = progression.current_tier ();

  if (amount > std::numeric_limits<Amount>::max ()
                  - progression.current_xp ())
    throw GameError (ErrorKind::INVALID_ARGUMENT, "XP overflow");
  Amount xp = progression.current_xp () + amount;

  /* Each iteration advances one tier, so the loop runs at most as often
     as the season has tiers.  */
  while (true)
    {
      proto::SeasonTier next;
      if (!LookupTier (season, progression.current_tier () + 1, next))
        {
          /* At the maximum tier, excess XP is dropped.  */
          xp = 0;
          break;
        }

      if (xp < next.xp_required ())
        break;

      xp -= next.xp_required ();
      progression.set_current_tier (next.tier_number ());
      *res.add_tier_up_rewards () = next;
    }

  progression.set_current_xp (xp);
  res.set_tiered_up (res.tier_up_rewards_size () > 0);
  UpdateProgression (progression);

  auto stmt = db.Prepare (R"(
    INSERT INTO `season_xp_history`
      (`progression`, `amount`, `source`, `tier_before`, `tier_after`,
       `awarded_at`)
      VALUES (?1, ?2, ?3, ?4, ?5, ?6)
  )");
  stmt.Bind (1, progression.id ());
  stmt.Bind (2, amount);
  stmt.Bind (3, source);
  stmt.Bind (4, tierBefore);
  stmt.Bind (5, progression.current_tier ());
  stmt.Bind (6, clock.GetCurrentTime ());
  stmt.Execute ();

  LOG (INFO)
      << "Awarded " << amount << " XP in season " << season
      << " to " << competitor << " (" << source << "), tier "
      << tierBefore << " -> " << progression.current_tier ();

  return res;
}

proto::ClaimedReward
SeasonEngine::ClaimReward (const std::string& competitor,
                           const std::string& season, const uint32_t tier)
{
  CHECK (db.IsInTransaction ());

  proto::SeasonProgression progression;
  if (!LookupProgression (competitor, season, progression)
        || progression.current_tier () < tier)
    throw GameError (ErrorKind::TIER_NOT_REACHED,
                     competitor + " has not reached "
                       + DescribeTier (season, tier));

  proto::ClaimedReward res;
  if (!LookupTier (season, tier, *res.mutable_tier ()))
    throw GameError (ErrorKind::TIER_NOT_FOUND,
                     "no such tier: " + DescribeTier (season, tier));
  const auto& tierData = res.tier ();

  if (tierData.is_premium () && !progression.has_battle_pass ())
    throw GameError (ErrorKind::BATTLE_PASS_REQUIRED,
                     DescribeTier (season, tier) + " requires a battle pass");

  if (IsClaimed (progression.id (), tier))
    throw GameError (ErrorKind::ALREADY_CLAIMED,
                     competitor + " already claimed "
                       + DescribeTier (season, tier));

  /* Apply the reward first:  If that fails (e.g. because the competitor
     has no currency account), the claim is not recorded.  */
  switch (tierData.reward_type ())
    {
    case proto::SeasonTier::CURRENCY:
    case proto::SeasonTier::PREMIUM_CURRENCY:
      if (tierData.reward_amount () > 0)
        ledger.Mint (competitor, tierData.reward_amount (),
                     "reward for " + DescribeTier (season, tier),
                     proto::CurrencyTransaction::REWARD);
      break;

    case proto::SeasonTier::ITEM:
      CHECK (tierData.has_reward_item ())
          << "Item reward without item for " << DescribeTier (season, tier);
      inventory.Acquire (competitor, tierData.reward_item (),
                         std::max<Amount> (1, tierData.reward_amount ()),
                         "reward");
      break;

    default:
      LOG (FATAL)
          << "Unexpected reward type " << tierData.reward_type ()
          << " for " << DescribeTier (season, tier);
    }

  res.set_progression_id (progression.id ());
  res.set_tier_number (tier);
  res.set_claimed_at (clock.GetCurrentTime ());

  auto stmt = db.Prepare (R"(
    INSERT INTO `claimed_reward`
      (`progression`, `tier_number`, `claimed_at`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, res.progression_id ());
  stmt.Bind (2, res.tier_number ());
  stmt.Bind (3, res.claimed_at ());
  stmt.Execute ();

  LOG (INFO)
      << competitor << " claimed the reward of "
      << DescribeTier (season, tier);

  return res;
}

proto::BattlePass
SeasonEngine::PurchaseBattlePass (const std::string& competitor,
                                  const std::string& season,
                                  const Amount price)
{
  CHECK (db.IsInTransaction ());

  proto::Season seasonData;
  if (!LookupSeason (season, seasonData))
    throw GameError (ErrorKind::SEASON_NOT_FOUND,
                     "season not found: " + season);

  if (HasBattlePass (competitor, season))
    throw GameError (ErrorKind::ALREADY_PURCHASED,
                     competitor + " already has the battle pass for "
                       + season);

  proto::BattlePass res;
  res.set_competitor (competitor);
  res.set_season (season);
  if (price > 0)
    res.set_price_paid (price);
  else if (seasonData.has_battle_pass_price ())
    res.set_price_paid (seasonData.battle_pass_price ());
  else
    res.set_price_paid (defaultPassPrice);

  ledger.Burn (competitor, res.price_paid (), "battle pass for " + season,
               proto::CurrencyTransaction::PURCHASE);

  res.set_purchased_at (clock.GetCurrentTime ());
  {
    auto stmt = db.Prepare (R"(
      INSERT INTO `battle_pass`
        (`competitor`, `season`, `price_paid`, `purchased_at`)
        VALUES (?1, ?2, ?3, ?4)
    )");
    stmt.Bind (1, competitor);
    stmt.Bind (2, season);
    stmt.Bind (3, res.price_paid ());
    stmt.Bind (4, res.purchased_at ());
    stmt.Execute ();
  }

  auto& progression = *res.mutable_progression ();
  progression = EnsureProgression (competitor, season);
  progression.set_has_battle_pass (true);
  UpdateProgression (progression);

  LOG (INFO)
      << competitor << " bought the battle pass for " << season
      << " at " << res.price_paid ();

  return res;
}

proto::ProgressionDetails
SeasonEngine::GetProgression (const std::string& competitor,
                              const std::string& season)
{
  proto::Season seasonData;
  if (!LookupSeason (season, seasonData))
    throw GameError (ErrorKind::SEASON_NOT_FOUND,
                     "season not found: " + season);

  proto::ProgressionDetails res;
  auto& progression = *res.mutable_progression ();
  const bool exists = LookupProgression (competitor, season, progression);
  if (!exists)
    {
      progression.set_competitor (competitor);
      progression.set_season (season);
      progression.set_current_tier (0);
      progression.set_current_xp (0);
      progression.set_has_battle_pass (HasBattlePass (competitor, season));
    }

  const uint32_t current = progression.current_tier ();
  const uint32_t lookahead = FLAGS_emporium_reward_lookahead;

  for (const auto& tier : GetTiers (season))
    {
      if (tier.tier_number () == current + 1)
        res.set_next_tier_xp (tier.xp_required ());
      if (tier.tier_number () > current + lookahead)
        continue;

      auto* status = res.add_rewards ();
      *status->mutable_tier () = tier;
      status->set_is_claimed (exists
                                && IsClaimed (progression.id (),
                                              tier.tier_number ()));
      status->set_is_available (tier.tier_number () <= current
                                  && !status->is_claimed ()
                                  && (!tier.is_premium ()
                                        || progression.has_battle_pass ()));
    }

  return res;
}

std::vector<proto::SeasonTier>
SeasonEngine::GetTiers (const std::string& season)
{
  auto stmt = db.Prepare (std::string ("SELECT ") + TIER_COLUMNS + R"(
      FROM `season_tier`
      WHERE `season` = ?1
      ORDER BY `tier_number`
  )");
  stmt.Bind (1, season);

  std::vector<proto::SeasonTier> res;
  while (stmt.Step ())
    res.push_back (ReadTier (stmt));

  return res;
}

} // namespace emporium
