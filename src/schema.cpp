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

#include "schema.hpp"

#include <glog/logging.h>

namespace emporium
{

void
SetupSchema (Database& db)
{
  /* Currency ledger.  A missing from_competitor in the log means that
     the currency was minted by the system, a missing to_competitor that
     it was burnt (paid to the system).  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `currency_balance` (
      `competitor` TEXT NOT NULL PRIMARY KEY,
      `game` TEXT NOT NULL,
      `balance` INTEGER NOT NULL CHECK (`balance` >= 0)
    );

    CREATE TABLE IF NOT EXISTS `currency_transaction` (
      `id` INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
      `from_competitor` TEXT NULL,
      `to_competitor` TEXT NULL,
      `amount` INTEGER NOT NULL CHECK (`amount` > 0),
      `reason` TEXT NOT NULL,
      `status` TEXT NOT NULL,
      `type` TEXT NOT NULL,
      `occurred_at` INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS `currency_transaction_from`
      ON `currency_transaction` (`from_competitor`);
    CREATE INDEX IF NOT EXISTS `currency_transaction_to`
      ON `currency_transaction` (`to_competitor`);

    CREATE TABLE IF NOT EXISTS `daily_reward` (
      `competitor` TEXT NOT NULL,
      `day` INTEGER NOT NULL,
      `amount` INTEGER NOT NULL,
      `transaction` INTEGER NOT NULL,
      PRIMARY KEY (`competitor`, `day`)
    );
  )");

  /* Inventory.  Entries are kept at quantity zero, so that the usage
     history stays attached.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `inventory` (
      `competitor` TEXT NOT NULL,
      `item` TEXT NOT NULL,
      `quantity` INTEGER NOT NULL CHECK (`quantity` >= 0),
      `use_count` INTEGER NOT NULL DEFAULT 0,
      `last_acquired_at` INTEGER NULL,
      `last_used_at` INTEGER NULL,
      PRIMARY KEY (`competitor`, `item`)
    );

    CREATE TABLE IF NOT EXISTS `item_usage` (
      `id` INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
      `competitor` TEXT NOT NULL,
      `item` TEXT NOT NULL,
      `quantity` INTEGER NOT NULL,
      `used_at` INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS `item_acquisition` (
      `id` INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
      `competitor` TEXT NOT NULL,
      `item` TEXT NOT NULL,
      `quantity` INTEGER NOT NULL,
      `source` TEXT NOT NULL,
      `acquired_at` INTEGER NOT NULL
    );
  )");

  /* Trading.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `trade_offer` (
      `id` INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
      `from_competitor` TEXT NOT NULL,
      `to_competitor` TEXT NOT NULL,
      `state` TEXT NOT NULL,
      `offered_currency` INTEGER NOT NULL DEFAULT 0,
      `requested_currency` INTEGER NOT NULL DEFAULT 0,
      `created_at` INTEGER NOT NULL,
      `expires_at` INTEGER NOT NULL,
      `completed_at` INTEGER NULL
    );
    CREATE INDEX IF NOT EXISTS `trade_offer_state_expiry`
      ON `trade_offer` (`state`, `expires_at`);

    CREATE TABLE IF NOT EXISTS `trade_item` (
      `trade` INTEGER NOT NULL REFERENCES `trade_offer` (`id`),
      `position` INTEGER NOT NULL,
      `item` TEXT NOT NULL,
      `quantity` INTEGER NOT NULL CHECK (`quantity` > 0),
      `from_competitor` INTEGER NOT NULL,
      PRIMARY KEY (`trade`, `position`)
    );
  )");

  /* Seasons.  The season and tier tables are the (read-only) catalog.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `season` (
      `id` TEXT NOT NULL PRIMARY KEY,
      `game` TEXT NOT NULL,
      `name` TEXT NOT NULL,
      `battle_pass_price` INTEGER NULL
    );

    CREATE TABLE IF NOT EXISTS `season_tier` (
      `season` TEXT NOT NULL REFERENCES `season` (`id`),
      `tier_number` INTEGER NOT NULL,
      `xp_required` INTEGER NOT NULL CHECK (`xp_required` >= 0),
      `reward_type` TEXT NOT NULL,
      `reward_amount` INTEGER NOT NULL,
      `reward_item` TEXT NULL,
      `is_premium` INTEGER NOT NULL,
      PRIMARY KEY (`season`, `tier_number`)
    );

    CREATE TABLE IF NOT EXISTS `season_progression` (
      `id` INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
      `competitor` TEXT NOT NULL,
      `season` TEXT NOT NULL,
      `current_tier` INTEGER NOT NULL CHECK (`current_tier` >= 0),
      `current_xp` INTEGER NOT NULL CHECK (`current_xp` >= 0),
      `has_battle_pass` INTEGER NOT NULL DEFAULT 0,
      UNIQUE (`competitor`, `season`)
    );

    CREATE TABLE IF NOT EXISTS `season_xp_history` (
      `id` INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
      `progression` INTEGER NOT NULL
          REFERENCES `season_progression` (`id`),
      `amount` INTEGER NOT NULL,
      `source` TEXT NOT NULL,
      `tier_before` INTEGER NOT NULL,
      `tier_after` INTEGER NOT NULL,
      `awarded_at` INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS `claimed_reward` (
      `progression` INTEGER NOT NULL
          REFERENCES `season_progression` (`id`),
      `tier_number` INTEGER NOT NULL,
      `claimed_at` INTEGER NOT NULL,
      PRIMARY KEY (`progression`, `tier_number`)
    );

    CREATE TABLE IF NOT EXISTS `battle_pass` (
      `competitor` TEXT NOT NULL,
      `season` TEXT NOT NULL,
      `price_paid` INTEGER NOT NULL,
      `purchased_at` INTEGER NOT NULL,
      PRIMARY KEY (`competitor`, `season`)
    );
  )");

  /* Shop.  The rules are a serialised RuleSet proto.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `shop_item` (
      `id` TEXT NOT NULL PRIMARY KEY,
      `game` TEXT NOT NULL,
      `name` TEXT NOT NULL,
      `price` INTEGER NOT NULL CHECK (`price` > 0),
      `stock` INTEGER NULL CHECK (`stock` >= 0),
      `available` INTEGER NOT NULL,
      `rules` BLOB NULL
    );

    CREATE TABLE IF NOT EXISTS `shop_transaction` (
      `id` INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
      `competitor` TEXT NOT NULL,
      `item` TEXT NOT NULL,
      `quantity` INTEGER NOT NULL,
      `price_per_unit` INTEGER NOT NULL,
      `transaction` INTEGER NOT NULL
          REFERENCES `currency_transaction` (`id`),
      `occurred_at` INTEGER NOT NULL
    );
  )");

  VLOG (1) << "Database schema is set up";
}

} // namespace emporium
