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

#include "catalog.hpp"

#include <glog/logging.h>

#include <cmath>
#include <set>
#include <utility>

namespace emporium
{

namespace
{

/** Number of tiers in the default curve.  */
constexpr unsigned DEFAULT_TIERS = 100;

/** Every n-th tier of the default curve is a premium tier.  */
constexpr unsigned PREMIUM_EVERY = 5;

void
LoadSeason (Database& db, const proto::Season& season)
{
  if (season.id ().empty () || season.game ().empty ())
    throw CatalogError ("season without id or game");

  {
    auto stmt = db.Prepare (R"(
      INSERT INTO `season`
        (`id`, `game`, `name`, `battle_pass_price`)
        VALUES (?1, ?2, ?3, ?4)
        ON CONFLICT (`id`) DO UPDATE
          SET `game` = ?2, `name` = ?3, `battle_pass_price` = ?4
    )");
    stmt.Bind (1, season.id ());
    stmt.Bind (2, season.game ());
    stmt.Bind (3, season.name ());
    if (season.has_battle_pass_price ())
      stmt.Bind (4, season.battle_pass_price ());
    else
      stmt.BindNull (4);
    stmt.Execute ();
  }

  std::vector<proto::SeasonTier> tiers;
  if (season.tiers_size () == 0)
    tiers = GenerateDefaultTiers (season.id ());
  else
    tiers.assign (season.tiers ().begin (), season.tiers ().end ());

  {
    auto stmt = db.Prepare (R"(
      DELETE FROM `season_tier`
        WHERE `season` = ?1
    )");
    stmt.Bind (1, season.id ());
    stmt.Execute ();
  }

  std::set<uint32_t> seen;
  auto stmt = db.Prepare (R"(
    INSERT INTO `season_tier`
      (`season`, `tier_number`, `xp_required`,
       `reward_type`, `reward_amount`, `reward_item`, `is_premium`)
      VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
  )");
  for (const auto& t : tiers)
    {
      if (t.tier_number () == 0 || !seen.insert (t.tier_number ()).second)
        throw CatalogError ("invalid or duplicate tier number in season "
                              + season.id ());
      if (t.xp_required () < 0 || t.reward_amount () < 0)
        throw CatalogError ("negative tier values in season " + season.id ());
      if (!t.has_reward_type ())
        throw CatalogError ("tier without reward type in season "
                              + season.id ());
      if (t.reward_type () == proto::SeasonTier::ITEM
            && t.reward_item ().empty ())
        throw CatalogError ("item reward without item in season "
                              + season.id ());

      stmt.Bind (1, season.id ());
      stmt.Bind (2, t.tier_number ());
      stmt.Bind (3, t.xp_required ());
      stmt.Bind (4, proto::SeasonTier::RewardType_Name (t.reward_type ()));
      stmt.Bind (5, t.reward_amount ());
      if (t.has_reward_item ())
        stmt.Bind (6, t.reward_item ());
      else
        stmt.BindNull (6);
      stmt.Bind (7, t.is_premium ());
      stmt.Execute ();
      stmt.Reset ();
    }

  LOG (INFO)
      << "Loaded season " << season.id () << " with " << tiers.size ()
      << " tiers";
}

void
LoadShopItem (Database& db, const proto::ShopItem& item)
{
  if (item.id ().empty () || item.game ().empty ())
    throw CatalogError ("shop item without id or game");
  if (item.price () <= 0)
    throw CatalogError ("shop item " + item.id () + " has no positive price");
  if (item.has_stock () && item.stock () < 0)
    throw CatalogError ("shop item " + item.id () + " has negative stock");

  proto::RuleSet rules;
  *rules.mutable_rules () = item.purchase_rules ();
  std::string rulesBlob;
  CHECK (rules.SerializeToString (&rulesBlob));

  {
    auto stmt = db.Prepare (R"(
      INSERT OR IGNORE INTO `shop_item`
        (`id`, `game`, `name`, `price`, `stock`, `available`)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )");
    stmt.Bind (1, item.id ());
    stmt.Bind (2, item.game ());
    stmt.Bind (3, item.name ());
    stmt.Bind (4, item.price ());
    if (item.has_stock ())
      stmt.Bind (5, item.stock ());
    else
      stmt.BindNull (5);
    stmt.Bind (6, item.available ());
    stmt.Execute ();
  }

  auto stmt = db.Prepare (R"(
    UPDATE `shop_item`
      SET `game` = ?2, `name` = ?3, `price` = ?4, `available` = ?5,
          `rules` = ?6
      WHERE `id` = ?1
  )");
  stmt.Bind (1, item.id ());
  stmt.Bind (2, item.game ());
  stmt.Bind (3, item.name ());
  stmt.Bind (4, item.price ());
  stmt.Bind (5, item.available ());
  stmt.BindBlob (6, rulesBlob);
  stmt.Execute ();

  VLOG (1) << "Loaded shop item " << item.id ();
}

} // anonymous namespace

std::vector<proto::SeasonTier>
GenerateDefaultTiers (const std::string& season)
{
  std::vector<proto::SeasonTier> res;
  for (unsigned i = 1; i <= DEFAULT_TIERS; ++i)
    {
      proto::SeasonTier t;
      t.set_season (season);
      t.set_tier_number (i);
      t.set_xp_required (static_cast<int64_t> (
          std::floor (1'000.0 * std::pow (1.05, i - 1))));

      if (i % PREMIUM_EVERY == 0)
        {
          t.set_reward_type (proto::SeasonTier::PREMIUM_CURRENCY);
          t.set_reward_amount (10 * i);
          t.set_is_premium (true);
        }
      else
        {
          t.set_reward_type (proto::SeasonTier::CURRENCY);
          t.set_reward_amount (5 * i);
          t.set_is_premium (false);
        }

      res.push_back (std::move (t));
    }

  return res;
}

void
LoadCatalog (Database& db, const proto::Config& config)
{
  if (config.trade_expiry_seconds () <= 0)
    throw CatalogError ("trade expiry must be positive");
  if (config.default_battle_pass_price () <= 0)
    throw CatalogError ("default battle-pass price must be positive");
  if (config.daily_reward_amount () <= 0)
    throw CatalogError ("daily reward amount must be positive");

  Transaction tx(db);

  for (const auto& s : config.seasons ())
    LoadSeason (db, s);
  for (const auto& i : config.shop_items ())
    LoadShopItem (db, i);

  tx.Commit ();

  LOG (INFO)
      << "Catalog loaded: " << config.seasons_size () << " seasons, "
      << config.shop_items_size () << " shop items";
}

} // namespace emporium
